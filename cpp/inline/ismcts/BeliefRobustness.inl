#include "ismcts/BeliefRobustness.hpp"

#include "util/Asserts.hpp"
#include "util/EigenUtil.hpp"
#include "util/LoggingUtil.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

namespace ismcts {

template <int kNumPlayers>
typename BeliefRobustness<kNumPlayers>::IntervalArray BeliefRobustness<kNumPlayers>::Phi(
  int c, float eps, const IntervalArrayVec& Q, const LocalDistribution& H) {
  int n = H.size();
  RELEASE_ASSERT(int(Q.size()) == n, "Phi(): Q has size {}, H has size {}", Q.size(), n);
  RELEASE_ASSERT(c >= 0 && c < n, "Phi(): c={} out of range [0, {})", c, n);
  RELEASE_ASSERT(eps >= 0 && eps <= 1, "Phi(): eps={} outside [0, 1]", eps);

  IntervalArray out;
  LocalDistribution q(n);
  for (int p = 0; p < kNumPlayers; ++p) {
    for (bound_t bound : {kLower, kUpper}) {
      // Pessimistic bound: q[c] low, every other q[i] high. Optimistic bound: the reverse.
      bound_t other = bound == kLower ? kUpper : kLower;
      for (int i = 0; i < n; ++i) {
        q(i) = Q[i](p, other);
      }
      q(c) = Q[c](p, bound);

      // The objective is q[c] - <H', q>. To push it down, mass flows from low-q states to high-q
      // states; to push it up, the other way around.
      std::vector<int> ascending = eigen_util::argsort(q);
      std::vector<int> descending(ascending.rbegin(), ascending.rend());

      LocalDistribution H_prime = H;
      if (bound == kLower) {
        shift_mass(H_prime, eps, ascending, descending);
      } else {
        shift_mass(H_prime, eps, descending, ascending);
      }
      DEBUG_ASSERT(std::abs(H_prime.sum() - H.sum()) < 1e-4, "Phi(): mass not conserved {} -> {}",
                   H.sum(), H_prime.sum());

      out(p, bound) = q(c) - (H_prime * q).sum();
    }
  }

  LOG_TRACE("Phi(c={}, eps={}, H={}) = {}", c, eps, eigen_util::to_string(H),
            Types::to_string(out));
  return out;
}

template <int kNumPlayers>
void BeliefRobustness<kNumPlayers>::shift_mass(LocalDistribution& H_prime, float eps,
                                               const std::vector<int>& donors,
                                               const std::vector<int>& receivers) {
  float removed = 0;
  for (int i : donors) {
    if (removed >= eps) break;
    float delta = std::min(eps - removed, H_prime(i));
    H_prime(i) -= delta;
    removed += delta;
  }

  float remaining = removed;
  for (int i : receivers) {
    if (remaining <= 0) break;
    float delta = std::min(remaining, 1 - H_prime(i));
    H_prime(i) += delta;
    remaining -= delta;
  }
}

}  // namespace ismcts
