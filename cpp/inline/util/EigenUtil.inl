#include "util/EigenUtil.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <numeric>

namespace eigen_util {

template <typename Array>
bool normalize(Array& array, double eps) {
  auto s = array.sum();
  if (s < eps) return false;

  array /= s;
  return true;
}

template <typename Array>
std::vector<int> argsort(const Array& array) {
  std::vector<int> indices(array.size());
  std::iota(indices.begin(), indices.end(), 0);
  std::stable_sort(indices.begin(), indices.end(),
                   [&](int a, int b) { return array(a) < array(b); });
  return indices;
}

template <typename Array>
int argmax(const Array& array) {
  int best = 0;
  for (int i = 1; i < array.size(); ++i) {
    if (array(i) > array(best)) best = i;
  }
  return best;
}

template <typename Array>
std::string to_string(const Array& array) {
  std::string out = "[";
  if (array.cols() == 1) {
    for (int r = 0; r < array.rows(); ++r) {
      if (r) out += ", ";
      out += fmt::format("{}", array(r, 0));
    }
  } else {
    for (int r = 0; r < array.rows(); ++r) {
      if (r) out += ", ";
      out += "[";
      for (int c = 0; c < array.cols(); ++c) {
        if (c) out += ", ";
        out += fmt::format("{}", array(r, c));
      }
      out += "]";
    }
  }
  out += "]";
  return out;
}

}  // namespace eigen_util
