#include "EvaluationTypes.hpp"

#include <vector>
#include <cmath>     // For std::isnan, std::abs
#include <limits>    // For std::numeric_limits
#include <stdexcept> // For std::logic_error

size_t HyperparameterGridResult::size() const
{
    checkConsistency();
    return learningRate.size();
}

void HyperparameterGridResult::append(double lr, double reg, const CrossValidationResult &cv)
{
    constexpr double undefined = std::numeric_limits<double>::quiet_NaN();

    learningRate.push_back(lr);
    regStrength.push_back(reg);
    accuracy.push_back(cv.accuracy);
    fairness.push_back(cv.fairness.value_or(undefined));
    tradeoff.push_back(cv.tradeoff.value_or(undefined));
    epoch.push_back(cv.epoch);
}

void HyperparameterGridResult::checkConsistency() const
{
    size_t n = learningRate.size();
    if (regStrength.size() != n || accuracy.size() != n || fairness.size() != n ||
        tradeoff.size() != n || epoch.size() != n)
    {
        throw std::logic_error("HyperparameterGridResult::checkConsistency: Result sequences have different lengths.");
    }
}

std::optional<size_t> HyperparameterGridResult::bestIndex(GridCriterion criterion) const
{
    checkConsistency();

    std::optional<size_t> best;
    double bestScore = -std::numeric_limits<double>::infinity();
    for (size_t i = 0; i < learningRate.size(); ++i)
    {
        double score = 0.0;
        switch (criterion)
        {
        case GridCriterion::MostAccurate:
            score = accuracy[i];
            break;
        case GridCriterion::MostFair:
            score = -std::abs(fairness[i]);
            break;
        case GridCriterion::BestTradeoff:
            score = tradeoff[i];
            break;
        }
        if (std::isnan(score))
            continue;
        // Strict comparison keeps the first trial on ties
        if (!best || score > bestScore)
        {
            best = i;
            bestScore = score;
        }
    }
    return best;
}
