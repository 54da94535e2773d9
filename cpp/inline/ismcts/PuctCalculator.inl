#include "ismcts/PuctCalculator.hpp"

#include "ismcts/DecisionNode.hpp"
#include "ismcts/Node.hpp"
#include "util/Asserts.hpp"
#include "util/EigenUtil.hpp"

#include <cmath>

namespace ismcts {

template <concepts::Traits Traits>
inline PuctCalculator<Traits>::PuctCalculator(const SearchParams& params, const DecisionNode* node)
    : seat(node->active_seat()),
      P(node->P()),
      N(P.rows()),
      Q_lower(P.rows()),
      Q_upper(P.rows()),
      PUCT_lower(P.rows()),
      PUCT_upper(P.rows()) {
  DEBUG_ASSERT(node->is_expanded(), "PuctCalculator: node not expanded");

  for (int i = 0; i < node->num_actions(); ++i) {
    const auto* child = node->child(i);
    const auto& Q = child->Q();
    N(i) = child->N();
    Q_lower(i) = Q(seat, kLower);
    Q_upper(i) = Q(seat, kUpper);
  }

  LocalPolicyArray bonus = params.cPUCT * P * std::sqrt(N.sum()) / (N + 1.0f);
  PUCT_lower = Q_lower + bonus;
  PUCT_upper = Q_upper + bonus;

  best = eigen_util::argmax(PUCT_lower);
  float m = PUCT_lower(best);
  for (int i = 0; i < node->num_actions(); ++i) {
    if (PUCT_upper(i) >= m) candidates.push_back(i);
  }
  DEBUG_ASSERT(!candidates.empty(), "PuctCalculator: best action {} is not a candidate", best);
}

}  // namespace ismcts
