#pragma once
#include "types.hpp"
#include "BinaryLabelDataset.hpp"

#include <string>
#include <optional> // For std::optional

/**
 * Multiplicative instance-weight factors, one per (group, label) cell.
 * factor = expected weight of the cell under independence / observed weight
 *        = (W_group * W_label) / (W * W_group_label)
 */
struct ReweighingFactors
{
    double privilegedFavorable = 1.0;
    double privilegedUnfavorable = 1.0;
    double unprivilegedFavorable = 1.0;
    double unprivilegedUnfavorable = 1.0;
};

/**
 * Pre-processing bias mitigation: reweigh every training instance so that the
 * protected attribute and the label become independent under the new weights.
 * Rows outside both groups keep their weight.
 */
class Reweighing
{
private:
    std::string _protectedAttribute;
    std::optional<ReweighingFactors> _factors;

public:
    explicit Reweighing(const std::string &protectedAttribute);

    // Learn the four factors from the (weighted) joint distribution of group and label.
    void fit(const BinaryLabelDataset &dataset);

    // Copy of dataset with each weight multiplied by the factor of its cell.
    BinaryLabelDataset transform(const BinaryLabelDataset &dataset) const;

    BinaryLabelDataset fitTransform(const BinaryLabelDataset &dataset);

    bool isFitted() const;

    // Throws std::logic_error if not fitted
    const ReweighingFactors &factors() const;
};
