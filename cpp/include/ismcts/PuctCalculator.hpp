#pragma once

#include "ismcts/BasicTypes.hpp"
#include "ismcts/SearchParams.hpp"
#include "ismcts/concepts/TraitsConcept.hpp"

#include <vector>

namespace ismcts {

template <concepts::Traits Traits>
class DecisionNode;

/*
 * Snapshot of the per-action statistics of an expanded DecisionNode, from the perspective of its
 * acting seat, together with the interval-PUCT scores
 *
 *   PUCT_<bound>[a] = Q_<bound>[a] + cPUCT * P[a] * sqrt(sum(N)) / (N[a] + 1)
 *
 * best is the argmax of PUCT_lower. candidates holds every action whose PUCT_upper reaches
 * PUCT_lower[best], in ascending order. best is always a candidate.
 */
template <concepts::Traits Traits>
struct PuctCalculator {
  using DecisionNode = ismcts::DecisionNode<Traits>;
  using LocalPolicyArray = Traits::Types::LocalDistribution;

  PuctCalculator(const SearchParams& params, const DecisionNode* node);

  seat_index_t seat;
  LocalPolicyArray P;
  LocalPolicyArray N;        // child visit count
  LocalPolicyArray Q_lower;  // child Q, pessimistic bound
  LocalPolicyArray Q_upper;  // child Q, optimistic bound
  LocalPolicyArray PUCT_lower;
  LocalPolicyArray PUCT_upper;

  int best;
  std::vector<int> candidates;
};

}  // namespace ismcts

#include "inline/ismcts/PuctCalculator.inl"
