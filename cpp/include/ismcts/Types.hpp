#pragma once

#include "ismcts/BasicTypes.hpp"
#include "ismcts/Constants.hpp"
#include "util/EigenUtil.hpp"

#include <Eigen/Core>

#include <string>
#include <vector>

namespace ismcts {

/*
 * Value types shared by every part of the search, parameterized by the number of players.
 *
 * An IntervalArray holds one (lower, upper) pair per player: row p is player p, column kLower is
 * the pessimistic bound and column kUpper the optimistic bound. Every IntervalArray that the search
 * stores satisfies lower <= upper in every row.
 */
template <int kNumPlayers>
struct Types {
  static_assert(kNumPlayers > 0);

  using ValueArray = Eigen::Array<float, kNumPlayers, 1>;
  using IntervalArray = Eigen::Array<float, kNumPlayers, kNumBounds>;
  using IntervalArrayVec = std::vector<IntervalArray>;

  // Distribution over the children of a node (actions or hidden values)
  using LocalDistribution = eigen_util::DArray;

  // Promotes a scalar value per player to the degenerate interval [v, v].
  static IntervalArray to_interval_array(const ValueArray& v);

  // Returns true iff every bound is finite and lower <= upper for every player.
  static bool is_valid(const IntervalArray& Q);

  static IntervalArray zero_interval_array() { return IntervalArray::Zero(); }

  static std::string to_string(const IntervalArray& Q);
};

}  // namespace ismcts

#include "inline/ismcts/Types.inl"
