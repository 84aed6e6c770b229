#pragma once
#include "types.hpp"

#include <vector>

// Row positions of one cross-validation round.
struct FoldIndices
{
    IndexList train;
    IndexList test;
};

/**
 * K-fold splitter that keeps the label ratio of every fold as close to the overall
 * ratio as integer counts allow.
 *
 * Row indices are grouped by label (0 first, then 1), each group is shuffled with the
 * seed, the groups are concatenated and position t is assigned to fold t mod k.
 * Fold sizes therefore differ by at most one, and so does the count of each label.
 */
class StratifiedKFold
{
private:
    int _numSplits;
    unsigned int _seed;
    bool _shuffle;

public:
    static constexpr int DEFAULT_NUM_SPLITS = 5;
    static constexpr unsigned int DEFAULT_SEED = 16;

    StratifiedKFold(int numSplits = DEFAULT_NUM_SPLITS, unsigned int seed = DEFAULT_SEED, bool shuffle = true);

    int numSplits() const;

    /**
     * Returns numSplits rounds. In round f the test part is fold f and the train part
     * is the union of the others, both sorted by row position.
     * Throws if numSplits exceeds the number of rows; warns on stderr if a label has
     * fewer members than folds.
     */
    std::vector<FoldIndices> split(const Vector &labels) const;

    // Fold number (0..numSplits-1) of every row
    std::vector<int> assignFolds(const Vector &labels) const;
};
