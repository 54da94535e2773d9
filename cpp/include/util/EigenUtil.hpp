#pragma once

#include <Eigen/Core>

#include <string>
#include <vector>

/*
 * Various util functions that make the eigen3 library more pleasant to use.
 */
namespace eigen_util {

// DArray is a dynamic float Eigen::Array (column vector)
using DArray = Eigen::Array<float, Eigen::Dynamic, 1>;

// FArray is a fixed-size float Eigen::Array of size N
template <int N>
using FArray = Eigen::Array<float, N, 1>;

/*
 * Divides array by its sum.
 *
 * If the sum is less than eps, then array is left unchanged and returns false. Otherwise,
 * returns true.
 */
template <typename Array>
bool normalize(Array& array, double eps = 1e-8);

/*
 * Returns the indices that would sort the 1D array in ascending order. Ties are broken by index,
 * so the result is deterministic.
 *
 * argsort([0.3, 0.1, 0.2]) -> [1, 2, 0]
 */
template <typename Array>
std::vector<int> argsort(const Array& array);

/*
 * Returns the index of the first maximal element of the 1D array.
 */
template <typename Array>
int argmax(const Array& array);

/*
 * Returns a one-line representation of the array, suitable for log lines.
 *
 * to_string([1, 0.5]) -> "[1, 0.5]"
 *
 * For a 2D array, rows are separated by ", " and wrapped in an outer pair of brackets.
 */
template <typename Array>
std::string to_string(const Array& array);

}  // namespace eigen_util

#include "inline/util/EigenUtil.inl"
