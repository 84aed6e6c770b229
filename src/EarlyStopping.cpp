#include "EarlyStopping.hpp"

#include <stdexcept> // For std::invalid_argument
#include <functional>

EarlyStopping::EarlyStopping(int checkInterval, double minDelta, double initialBestLoss)
    : _checkInterval(checkInterval), _minDelta(minDelta), _bestLoss(initialBestLoss)
{
    if (_checkInterval <= 0)
        throw std::invalid_argument("EarlyStopping constructor: checkInterval must be positive.");
    if (_minDelta < 0.0)
        throw std::invalid_argument("EarlyStopping constructor: minDelta must be non-negative.");
}

bool EarlyStopping::isCheckpoint(int epoch) const
{
    return epoch > 0 && epoch % _checkInterval == 0;
}

bool EarlyStopping::update(int epoch, const std::function<double()> &evaluateLoss)
{
    if (!isCheckpoint(epoch))
        return false;

    double loss = evaluateLoss();
    // Written as a negation so that a NaN loss also stops training
    if (!(loss <= _bestLoss - _minDelta))
        return true;

    _bestLoss = loss;
    return false;
}

double EarlyStopping::bestLoss() const
{
    return _bestLoss;
}
