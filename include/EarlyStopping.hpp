#pragma once

#include <functional> // For std::function

/**
 * Convergence check on a validation loss, run every checkInterval epochs.
 *
 * At a checkpoint the validation loss is compared with the best loss seen so far.
 * Training stops if it did not improve by at least minDelta, i.e. when
 * newLoss > bestLoss - minDelta. Otherwise the best loss is updated.
 *
 * With an epoch budget below checkInterval no checkpoint is ever reached and only
 * the budget ends training.
 */
class EarlyStopping
{
private:
    int _checkInterval;
    double _minDelta;
    double _bestLoss;

public:
    static constexpr int DEFAULT_CHECK_INTERVAL = 100;
    static constexpr double DEFAULT_MIN_DELTA = 1e-3;
    static constexpr double DEFAULT_INITIAL_BEST_LOSS = 10.0;

    EarlyStopping(int checkInterval = DEFAULT_CHECK_INTERVAL,
                  double minDelta = DEFAULT_MIN_DELTA,
                  double initialBestLoss = DEFAULT_INITIAL_BEST_LOSS);

    // True if the given (1-based) epoch count is a checkpoint
    bool isCheckpoint(int epoch) const;

    /**
     * Call after every update with the number of updates performed so far.
     * evaluateLoss is only invoked at checkpoints. Returns true if training should stop.
     */
    bool update(int epoch, const std::function<double()> &evaluateLoss);

    double bestLoss() const;
};
