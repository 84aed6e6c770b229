#pragma once
#include <vector>
#include <string>
#include <Eigen/Dense>

/**
 * Introduce aliases for Eigen types to improve readability.
 * A feature table is a Matrix with one row per instance; labels, weights and
 * predictions are column Vectors with one entry per instance.
 */
using Matrix = Eigen::MatrixXd;
using Vector = Eigen::VectorXd;
using RowVector = Eigen::RowVectorXd;

// Row (or column) positions into a dataset. Fold construction and subsetting use this.
using IndexList = std::vector<int>;

// Label convention used throughout (favorable outcome is 1).
constexpr double FAVORABLE_LABEL = 1.0;
constexpr double UNFAVORABLE_LABEL = 0.0;

// Protected attribute convention (privileged group has value 1).
constexpr double PRIVILEGED_VALUE = 1.0;
constexpr double UNPRIVILEGED_VALUE = 0.0;

// Upper bound on the number of model inputs
constexpr Eigen::Index MAX_REASONABLE_SIZE = 10000000;

// Forward declarations (optional)
class BinaryLabelDataset;
struct BaseClassifier;
class FairnessMetrics;
class Reweighing;
class TradeoffEvaluator;

// Helper function to print a vector
void printVector(const std::string &name, const Vector &values);
