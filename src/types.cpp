#include "types.hpp"

#include <vector>
#include <string>
#include <iostream>
#include <Eigen/Dense> // For Eigen matrix operations

void printVector(const std::string &name, const Vector &values)
{
    // Use Eigen's IO to format the output
    Eigen::IOFormat CommaInitFmt(Eigen::StreamPrecision, Eigen::DontAlignCols, ", ", ", ", "", "", "[", "]");
    std::cout << name << " : " << values.transpose().format(CommaInitFmt) << std::endl;
}
