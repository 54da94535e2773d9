#pragma once

#include "ismcts/BasicTypes.hpp"
#include "ismcts/NodeBase.hpp"
#include "ismcts/SearchContext.hpp"
#include "ismcts/concepts/TraitsConcept.hpp"

#include <memory>
#include <vector>

namespace ismcts {

template <concepts::Traits Traits>
class Node;

/*
 * A DecisionNode is where the acting seat picks one of its legal public actions. It owns one child
 * per legal action, created all at once on expansion.
 *
 * Rather than averaging the outcomes that flowed through it, a DecisionNode remembers the empirical
 * action-selection history, split into two running distributions:
 *
 * PURE: average of the one-hot distributions chosen in the pure selection case.
 * MIXED: average of the restricted priors sampled from in the mixed selection case.
 *
 * On backup, Q becomes the (n_pure, n_mixed)-weighted blend of these two distributions applied to
 * the children's current Q values. Since both are distributions and each child's Q is a valid
 * interval, the blend is again a valid interval.
 */
template <concepts::Traits Traits>
class DecisionNode : public NodeBase<Traits> {
 public:
  using Base = NodeBase<Traits>;
  using InfoSet = Traits::InfoSet;
  using Types = Traits::Types;
  using IntervalArray = Types::IntervalArray;
  using IntervalArrayVec = Types::IntervalArrayVec;
  using LocalPolicyArray = Types::LocalDistribution;
  using SearchContext = ismcts::SearchContext<Traits>;
  using Node = ismcts::Node<Traits>;
  using node_uptr_t = std::unique_ptr<Node>;

  // Record of the most recent selection, kept for diagnostics.
  struct Selection {
    selection_case_t selection_case = kNoSelection;
    int action_index = -1;
    std::vector<int> candidates;  // indices into actions()
  };

  DecisionNode(const InfoSet& info_set, const IntervalArray& Q);

  // Performs one visit. The first visit to a non-terminal node expands it and ends the simulation.
  // Later visits select a child, recurse into it, and back up.
  void visit(SearchContext& context);

  int num_actions() const { return actions_.size(); }
  const std::vector<action_t>& actions() const { return actions_; }

  // Returns nullptr before expansion.
  const Node* child(int action_index) const { return child_ptr(action_index); }
  Node* child(int action_index) { return child_ptr(action_index); }

  // Index of action in actions(), or -1 if it is not legal here.
  int action_index(action_t action) const;

  // Valid only after expansion
  const LocalPolicyArray& P() const { return P_; }
  const IntervalArray& V() const { return V_; }
  const IntervalArrayVec& Vc() const { return Vc_; }

  const LocalPolicyArray& PURE() const { return PURE_; }
  const LocalPolicyArray& MIXED() const { return MIXED_; }
  int n_pure() const { return n_pure_; }
  int n_mixed() const { return n_mixed_; }

  const Selection& last_selection() const { return last_selection_; }

 private:
  Node* child_ptr(int action_index) const;

  void expand(SearchContext& context);

  // Picks the child to descend into, folding the choice into PURE or MIXED.
  int select(SearchContext& context);

  // Recomputes Q from PURE, MIXED and the children's current Q.
  void backup();

  std::vector<action_t> actions_;  // empty until expansion
  std::vector<node_uptr_t> children_;

  LocalPolicyArray P_;
  IntervalArray V_;
  IntervalArrayVec Vc_;

  LocalPolicyArray PURE_;
  LocalPolicyArray MIXED_;
  int n_pure_ = 0;
  int n_mixed_ = 0;

  Selection last_selection_;
};

}  // namespace ismcts

#include "inline/ismcts/DecisionNode.inl"
