#include "ismcts/DecisionNode.hpp"

#include "ismcts/Node.hpp"
#include "ismcts/PuctCalculator.hpp"
#include "util/Asserts.hpp"
#include "util/EigenUtil.hpp"
#include "util/LoggingUtil.hpp"
#include "util/Random.hpp"

#include <algorithm>
#include <utility>

namespace ismcts {

template <concepts::Traits Traits>
DecisionNode<Traits>::DecisionNode(const InfoSet& info_set, const IntervalArray& Q)
    : Base(info_set, Q) {}

template <concepts::Traits Traits>
void DecisionNode<Traits>::visit(SearchContext& context) {
  this->N_++;
  last_selection_ = Selection();

  if (this->is_terminal()) return;

  if (!this->is_expanded()) {
    expand(context);
    return;
  }

  int i = select(context);
  children_[i]->visit(context);
  backup();
}

template <concepts::Traits Traits>
int DecisionNode<Traits>::action_index(action_t action) const {
  auto it = std::find(actions_.begin(), actions_.end(), action);
  if (it == actions_.end()) return -1;
  return it - actions_.begin();
}

template <concepts::Traits Traits>
typename DecisionNode<Traits>::Node* DecisionNode<Traits>::child_ptr(int action_index) const {
  if (!this->is_expanded()) return nullptr;
  RELEASE_ASSERT(action_index >= 0 && action_index < num_actions(),
                 "DecisionNode::child(): index {} out of range [0, {})", action_index,
                 num_actions());
  return children_[action_index].get();
}

template <concepts::Traits Traits>
void DecisionNode<Traits>::expand(SearchContext& context) {
  const InfoSet& info_set = this->info_set_;
  std::vector<action_t> actions = info_set.legal_actions();
  int n = actions.size();
  RELEASE_ASSERT(n > 0, "DecisionNode::expand(): non-terminal node has no legal actions");

  auto eval = context.evaluator.evaluate_actions(info_set);
  eval.validate("DecisionNode::expand()", n);

  // Build everything locally so that a throwing evaluator or child constructor leaves this node
  // unexpanded.
  std::vector<node_uptr_t> children;
  children.reserve(n);
  for (int i = 0; i < n; ++i) {
    InfoSet child_info_set = info_set.apply(actions[i]);
    bool sampling = !child_info_set.terminal_outcome().has_value() &&
                    child_info_set.current_player() != this->active_seat_ &&
                    child_info_set.has_hidden_info();
    if (sampling) {
      children.push_back(Node::make_sampling(child_info_set, eval.Vc[i]));
    } else {
      children.push_back(Node::make_decision(child_info_set, eval.Vc[i]));
    }
  }

  actions_ = std::move(actions);
  children_ = std::move(children);
  P_ = eval.P;
  V_ = eval.V;
  Vc_ = std::move(eval.Vc);
  PURE_ = LocalPolicyArray::Zero(n);
  MIXED_ = LocalPolicyArray::Zero(n);
  this->set_Q(V_);
  this->expansion_state_ = kExpanded;

  LOG_DEBUG("DecisionNode expanded: seat={} actions={} P={} V={}", int(this->active_seat_), n,
            eigen_util::to_string(P_), Types::to_string(V_));
}

template <concepts::Traits Traits>
int DecisionNode<Traits>::select(SearchContext& context) {
  PuctCalculator<Traits> calc(context.params, this);

  Selection& selection = last_selection_;
  selection.candidates = calc.candidates;

  if (calc.candidates.size() == 1) {
    int a = calc.best;
    n_pure_++;
    PURE_ *= float(n_pure_ - 1) / n_pure_;
    PURE_(a) += 1.0f / n_pure_;

    selection.selection_case = kPure;
    selection.action_index = a;
    LOG_TRACE("DecisionNode::select(): pure a={} PUCT_lower={}", a,
              eigen_util::to_string(calc.PUCT_lower));
    return a;
  }

  LocalPolicyArray restricted = LocalPolicyArray::Zero(num_actions());
  for (int i : calc.candidates) {
    restricted(i) = P_(i);
  }
  RELEASE_ASSERT(eigen_util::normalize(restricted),
                 "DecisionNode::select(): zero prior mass on candidate set (seat={}, P={})",
                 int(this->active_seat_), eigen_util::to_string(P_));

  int a = util::Random::weighted_sample(context.prng, restricted.data(),
                                        restricted.data() + restricted.size());
  n_mixed_++;
  MIXED_ = (MIXED_ * float(n_mixed_ - 1) + restricted) / float(n_mixed_);

  selection.selection_case = kMixed;
  selection.action_index = a;
  LOG_TRACE("DecisionNode::select(): mixed a={} restricted={}", a,
            eigen_util::to_string(restricted));
  return a;
}

template <concepts::Traits Traits>
void DecisionNode<Traits>::backup() {
  float n = n_pure_ + n_mixed_;
  DEBUG_ASSERT(n > 0, "DecisionNode::backup(): no selections recorded");

  IntervalArray E_pure = IntervalArray::Zero();
  IntervalArray E_mixed = IntervalArray::Zero();
  for (int i = 0; i < num_actions(); ++i) {
    const IntervalArray& Qc = children_[i]->Q();
    E_pure += PURE_(i) * Qc;
    E_mixed += MIXED_(i) * Qc;
  }

  IntervalArray Q = (float(n_mixed_) * E_mixed + float(n_pure_) * E_pure) / n;
  this->set_Q(Q);
}

}  // namespace ismcts
