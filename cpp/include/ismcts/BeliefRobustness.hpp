#pragma once

#include "ismcts/Types.hpp"

namespace ismcts {

/*
 * Phi(c, eps, Q, H) bounds the advantage of "hidden value c is the real one" over the
 * belief-weighted average, when an adversary may perturb both the belief and the per-state values.
 *
 * H: belief over n hidden values.
 * Q: utility interval per hidden value (size n), per player.
 * c: an index sampled from H.
 *
 * Computes, for each player p, the interval
 *
 *   Phi(H) = union_{H' in N_eps(H)} union_{Q_lower <= q <= Q_upper} (q[c] - sum_i H'[i] * q[i])
 *
 * where N_eps(H) is the set of distributions obtained from H by moving at most eps of probability
 * mass (total variation distance eps), and q is chosen independently per hidden value.
 *
 * For a fixed bound the objective is linear in H' once q is fixed, and the extremal q does not
 * depend on H' (q[c] enters with coefficient 1 - H'[c] >= 0, every other q[i] with -H'[i] <= 0).
 * So each bound is one sort plus a greedy water-filling sweep: take up to eps of mass from the
 * states that hurt the objective least, and pour it onto the states that help it most, respecting
 * 0 <= H'[i] <= 1.
 *
 * eps must lie in [0, 1]. With eps == 0, Phi reduces to q[c] - sum_i H[i] * q[i] evaluated at the
 * extremal endpoints.
 */
template <int kNumPlayers>
struct BeliefRobustness {
  using Types = ismcts::Types<kNumPlayers>;
  using IntervalArray = Types::IntervalArray;
  using IntervalArrayVec = Types::IntervalArrayVec;
  using LocalDistribution = Types::LocalDistribution;

  static IntervalArray Phi(int c, float eps, const IntervalArrayVec& Q, const LocalDistribution& H);

 private:
  // Moves up to eps of mass out of H_prime, visiting indices in donor order, then pours the same
  // amount into H_prime, visiting indices in receiver order.
  static void shift_mass(LocalDistribution& H_prime, float eps, const std::vector<int>& donors,
                         const std::vector<int>& receivers);
};

}  // namespace ismcts

#include "inline/ismcts/BeliefRobustness.inl"
