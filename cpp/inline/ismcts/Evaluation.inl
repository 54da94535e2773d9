#include "ismcts/Evaluation.hpp"

#include "util/Asserts.hpp"

namespace ismcts {

template <int kNumPlayers>
void ActionEvaluation<kNumPlayers>::validate(const char* caller, int num_actions) const {
  RELEASE_ASSERT(P.size() == num_actions, "{}: prior has size {}, expected {}", caller, P.size(),
                 num_actions);
  RELEASE_ASSERT(int(Vc.size()) == num_actions, "{}: Vc has size {}, expected {}", caller,
                 Vc.size(), num_actions);
  RELEASE_ASSERT((P >= 0).all(), "{}: negative prior {}", caller, eigen_util::to_string(P));
  RELEASE_ASSERT(Types::is_valid(V), "{}: invalid V {}", caller, Types::to_string(V));
  for (int i = 0; i < num_actions; ++i) {
    RELEASE_ASSERT(Types::is_valid(Vc[i]), "{}: invalid Vc[{}] {}", caller, i,
                   Types::to_string(Vc[i]));
  }
}

template <int kNumPlayers>
void HiddenEvaluation<kNumPlayers>::validate(const char* caller,
                                             const hidden_value_mask_t& mask) const {
  int n = mask.size();
  RELEASE_ASSERT(H.size() == n, "{}: belief has size {}, expected {}", caller, H.size(), n);
  RELEASE_ASSERT(int(Vc.size()) == n, "{}: Vc has size {}, expected {}", caller, Vc.size(), n);
  RELEASE_ASSERT((H >= 0).all(), "{}: negative belief {}", caller, eigen_util::to_string(H));
  RELEASE_ASSERT(Types::is_valid(V), "{}: invalid V {}", caller, Types::to_string(V));
  for (int h = 0; h < n; ++h) {
    if (!mask[h]) continue;
    RELEASE_ASSERT(Types::is_valid(Vc[h]), "{}: invalid Vc[{}] {}", caller, h,
                   Types::to_string(Vc[h]));
  }
}

}  // namespace ismcts
