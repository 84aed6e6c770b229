#include "SyntheticData.hpp"
#include "BinaryLabelDataset.hpp"
#include "types.hpp"

#include <vector>
#include <string>
#include <iostream>
#include <random>      // For C++ random number generation
#include <cmath>       // For std::abs
#include <stdexcept>   // For std::invalid_argument
#include <Eigen/Dense>

BinaryLabelDataset generateSeparableData(size_t n, double margin, unsigned int seed)
{
    if (n == 0)
        throw std::invalid_argument("generateSeparableData: Number of samples must be positive.");
    if (margin < 0.0 || margin >= 3.0)
        throw std::invalid_argument("generateSeparableData: Margin must lie in [0, 3).");

    std::cout << "\nGenerating separable data (N=" << n << ", margin=" << margin
              << ", seed=" << seed << ")..." << std::endl;

    std::mt19937 rng(seed);
    std::bernoulli_distribution groupDist(0.5);
    std::normal_distribution<double> featureDist(0.0, 1.0);

    Eigen::Index rows = static_cast<Eigen::Index>(n);
    Matrix X(rows, 2);
    Vector Y(rows);
    for (Eigen::Index i = 0; i < rows; ++i)
    {
        double x = featureDist(rng);
        while (std::abs(x) < margin)
            x = featureDist(rng);

        X(i, 0) = groupDist(rng) ? PRIVILEGED_VALUE : UNPRIVILEGED_VALUE;
        X(i, 1) = x;
        Y(i) = x > 0.0 ? FAVORABLE_LABEL : UNFAVORABLE_LABEL;
    }

    return BinaryLabelDataset(X, Y, {"sex", "x"}, {"sex"});
}

BinaryLabelDataset generateBiasedData(size_t n, double flipProbability, double signalStrength, unsigned int seed)
{
    if (n == 0)
        throw std::invalid_argument("generateBiasedData: Number of samples must be positive.");
    if (flipProbability < 0.0 || flipProbability > 1.0)
        throw std::invalid_argument("generateBiasedData: Flip probability must lie in [0, 1].");

    std::cout << "\nGenerating biased data (N=" << n << ", flipProbability=" << flipProbability
              << ", signalStrength=" << signalStrength << ", seed=" << seed << ")..." << std::endl;

    std::mt19937 rng(seed);
    std::bernoulli_distribution groupDist(0.5);
    std::bernoulli_distribution flipDist(flipProbability);
    std::bernoulli_distribution raceGivenFavorable(0.6);
    std::bernoulli_distribution raceGivenUnfavorable(0.4);
    std::normal_distribution<double> noiseDist(0.0, 1.0);

    Eigen::Index rows = static_cast<Eigen::Index>(n);
    Matrix X(rows, 3);
    Vector Y(rows);
    for (Eigen::Index i = 0; i < rows; ++i)
    {
        bool privileged = groupDist(rng);
        bool favorable = flipDist(rng) ? !privileged : privileged;
        bool race = favorable ? raceGivenFavorable(rng) : raceGivenUnfavorable(rng);

        X(i, 0) = privileged ? PRIVILEGED_VALUE : UNPRIVILEGED_VALUE;
        X(i, 1) = race ? PRIVILEGED_VALUE : UNPRIVILEGED_VALUE;
        X(i, 2) = signalStrength * (favorable ? 1.0 : -1.0) + noiseDist(rng);
        Y(i) = favorable ? FAVORABLE_LABEL : UNFAVORABLE_LABEL;
    }

    std::cout << "Data generation completed." << std::endl;
    return BinaryLabelDataset(X, Y, {"sex", "race", "x"}, {"sex", "race"});
}
