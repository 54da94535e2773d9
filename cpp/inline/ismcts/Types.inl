#include "ismcts/Types.hpp"

#include <fmt/format.h>

#include <cmath>

namespace ismcts {

template <int kNumPlayers>
typename Types<kNumPlayers>::IntervalArray Types<kNumPlayers>::to_interval_array(
  const ValueArray& v) {
  IntervalArray Q;
  Q.col(kLower) = v;
  Q.col(kUpper) = v;
  return Q;
}

template <int kNumPlayers>
bool Types<kNumPlayers>::is_valid(const IntervalArray& Q) {
  for (int p = 0; p < kNumPlayers; ++p) {
    float lower = Q(p, kLower);
    float upper = Q(p, kUpper);
    if (!std::isfinite(lower) || !std::isfinite(upper)) return false;
    if (lower > upper) return false;
  }
  return true;
}

template <int kNumPlayers>
std::string Types<kNumPlayers>::to_string(const IntervalArray& Q) {
  std::string out = "{";
  for (int p = 0; p < kNumPlayers; ++p) {
    if (p) out += ", ";
    out += fmt::format("p{}:[{:.4f}, {:.4f}]", p, Q(p, kLower), Q(p, kUpper));
  }
  out += "}";
  return out;
}

}  // namespace ismcts
