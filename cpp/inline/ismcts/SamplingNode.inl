#include "ismcts/SamplingNode.hpp"

#include "ismcts/BeliefRobustness.hpp"
#include "ismcts/Node.hpp"
#include "util/Asserts.hpp"
#include "util/EigenUtil.hpp"
#include "util/LoggingUtil.hpp"
#include "util/Random.hpp"

#include <utility>

namespace ismcts {

namespace detail {

inline std::vector<hidden_value_t> legal_values(const hidden_value_mask_t& mask) {
  std::vector<hidden_value_t> values;
  for (auto h = mask.find_first(); h != hidden_value_mask_t::npos; h = mask.find_next(h)) {
    values.push_back(h);
  }
  return values;
}

}  // namespace detail

template <concepts::Traits Traits>
SamplingNode<Traits>::SamplingNode(const InfoSet& info_set, const IntervalArray& Q)
    : Base(info_set, Q),
      mask_(info_set.hidden_value_mask()),
      legal_values_(detail::legal_values(mask_)) {
  RELEASE_ASSERT(!legal_values_.empty(), "SamplingNode: empty hidden-value mask (size={})",
                 mask_.size());
  RELEASE_ASSERT(!this->is_terminal(), "SamplingNode: terminal information set");
}

template <concepts::Traits Traits>
void SamplingNode<Traits>::visit(SearchContext& context) {
  this->N_++;

  if (!this->is_expanded()) {
    expand(context);
    return;
  }

  hidden_value_t c = sample(context);
  children_[c]->visit(context);
}

template <concepts::Traits Traits>
typename SamplingNode<Traits>::Node* SamplingNode<Traits>::child_ptr(hidden_value_t h) const {
  if (!this->is_expanded()) return nullptr;
  RELEASE_ASSERT(h >= 0 && h < num_hidden_values(),
                 "SamplingNode::child(): hidden value {} out of range [0, {})", h,
                 num_hidden_values());
  return children_[h].get();
}

template <concepts::Traits Traits>
void SamplingNode<Traits>::expand(SearchContext& context) {
  const InfoSet& info_set = this->info_set_;
  int n = num_hidden_values();

  auto eval = context.evaluator.evaluate_hidden(info_set);
  eval.validate("SamplingNode::expand()", mask_);

  LocalDistribution H = LocalDistribution::Zero(n);
  for (hidden_value_t h : legal_values_) {
    H(h) = eval.H(h);
  }
  bool fallback = !eigen_util::normalize(H, context.params.belief_mass_threshold);
  if (fallback) {
    LOG_DEBUG("SamplingNode::expand(): masked belief mass {} below {}, using uniform over {} values",
              H.sum(), context.params.belief_mass_threshold, legal_values_.size());
    H.setZero();
    for (hidden_value_t h : legal_values_) {
      H(h) = 1.0f / legal_values_.size();
    }
  }

  std::vector<node_uptr_t> children(n);
  IntervalArrayVec Qc(n, Types::zero_interval_array());
  for (hidden_value_t h : legal_values_) {
    InfoSet child_info_set = info_set.instantiate(h);
    bool sampling =
      !child_info_set.terminal_outcome().has_value() && child_info_set.has_hidden_info();
    if (sampling) {
      RELEASE_ASSERT(child_info_set.current_player() == this->active_seat_,
                     "SamplingNode::expand(): hidden value {} changes acting seat {} -> {} "
                     "while hidden information remains",
                     h, int(this->active_seat_), int(child_info_set.current_player()));
      children[h] = Node::make_sampling(child_info_set, eval.Vc[h]);
    } else {
      children[h] = Node::make_decision(child_info_set, eval.Vc[h]);
    }
    Qc[h] = children[h]->Q();
  }

  int num_legal = legal_values_.size();
  LocalDistribution legal_H(num_legal);
  IntervalArrayVec legal_Qc(num_legal);
  for (int k = 0; k < num_legal; ++k) {
    legal_H(k) = H(legal_values_[k]);
    legal_Qc[k] = Qc[legal_values_[k]];
  }

  children_ = std::move(children);
  H_ = std::move(H);
  V_ = eval.V;
  Qc_ = std::move(Qc);
  legal_H_ = std::move(legal_H);
  legal_Qc_ = std::move(legal_Qc);
  used_uniform_fallback_ = fallback;
  this->set_Q(V_);
  this->expansion_state_ = kExpanded;

  LOG_DEBUG("SamplingNode expanded: seat={} legal={}/{} H={} V={}", int(this->active_seat_),
            num_legal, n, eigen_util::to_string(H_), Types::to_string(V_));
}

template <concepts::Traits Traits>
hidden_value_t SamplingNode<Traits>::sample(SearchContext& context) {
  int k = util::Random::weighted_sample(context.prng, legal_H_.data(),
                                        legal_H_.data() + legal_H_.size());
  hidden_value_t c = legal_values_[k];

  last_sample_ = c;
  last_phi_ = BeliefRobustness<Traits::kNumPlayers>::Phi(k, context.params.phi_eps, legal_Qc_,
                                                         legal_H_);
  LOG_TRACE("SamplingNode::sample(): c={} Phi={}", c, Types::to_string(*last_phi_));
  return c;
}

}  // namespace ismcts
