#include "StratifiedKFold.hpp"
#include "types.hpp"

#include <vector>
#include <string>
#include <algorithm> // For std::shuffle
#include <random>    // For std::mt19937
#include <stdexcept> // For std::invalid_argument
#include <iostream>  // For std::cerr

StratifiedKFold::StratifiedKFold(int numSplits, unsigned int seed, bool shuffle)
    : _numSplits(numSplits), _seed(seed), _shuffle(shuffle)
{
    if (_numSplits < 2)
        throw std::invalid_argument("StratifiedKFold constructor: Number of splits must be at least 2, got " +
                                    std::to_string(_numSplits) + ".");
}

int StratifiedKFold::numSplits() const
{
    return _numSplits;
}

std::vector<int> StratifiedKFold::assignFolds(const Vector &labels) const
{
    long long n = labels.size();
    if (n < _numSplits)
        throw std::invalid_argument("StratifiedKFold::split: Cannot have number of splits " + std::to_string(_numSplits) +
                                    " greater than the number of samples " + std::to_string(n) + ".");

    // Group rows by label
    IndexList unfavorable, favorable;
    for (int i = 0; i < static_cast<int>(n); ++i)
    {
        if (labels(i) == FAVORABLE_LABEL)
            favorable.push_back(i);
        else if (labels(i) == UNFAVORABLE_LABEL)
            unfavorable.push_back(i);
        else
            throw std::invalid_argument("StratifiedKFold::split: Labels must be 0 or 1, found " + std::to_string(labels(i)) + ".");
    }

    for (const IndexList *members : {&unfavorable, &favorable})
    {
        if (!members->empty() && static_cast<int>(members->size()) < _numSplits)
        {
            std::cerr << "StratifiedKFold::split: Warning: The least populated label has only " << members->size()
                      << " members, which is less than number of splits " << _numSplits << "." << std::endl;
        }
    }

    if (_shuffle)
    {
        std::mt19937 rng(_seed);
        std::shuffle(unfavorable.begin(), unfavorable.end(), rng);
        std::shuffle(favorable.begin(), favorable.end(), rng);
    }

    // Deal the concatenated label groups round-robin over the folds
    std::vector<int> foldOf(static_cast<size_t>(n), 0);
    int position = 0;
    for (const IndexList *members : {&unfavorable, &favorable})
    {
        for (int row : *members)
        {
            foldOf[static_cast<size_t>(row)] = position % _numSplits;
            ++position;
        }
    }
    return foldOf;
}

std::vector<FoldIndices> StratifiedKFold::split(const Vector &labels) const
{
    std::vector<int> foldOf = assignFolds(labels);

    std::vector<FoldIndices> folds(static_cast<size_t>(_numSplits));
    for (int row = 0; row < static_cast<int>(foldOf.size()); ++row)
    {
        for (int f = 0; f < _numSplits; ++f)
        {
            if (foldOf[static_cast<size_t>(row)] == f)
                folds[static_cast<size_t>(f)].test.push_back(row);
            else
                folds[static_cast<size_t>(f)].train.push_back(row);
        }
    }
    return folds;
}
