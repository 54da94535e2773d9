#pragma once

#include "ismcts/BasicTypes.hpp"
#include "ismcts/NodeBase.hpp"
#include "ismcts/SearchContext.hpp"
#include "ismcts/concepts/TraitsConcept.hpp"

#include <memory>
#include <optional>
#include <vector>

namespace ismcts {

template <concepts::Traits Traits>
class Node;

/*
 * A SamplingNode sits where the acting seat changes while hidden information is still unresolved.
 * Its children are indexed by hidden value: one per legal hidden value, created all at once on
 * expansion. Children for illegal hidden values are never created.
 *
 * The belief H is the evaluator's belief restricted to the legal hidden values and renormalized.
 * Each visit after expansion samples a hidden value c from H and descends into children[c].
 *
 * Q is set from the evaluator's V on expansion and is not backed up afterwards. Qc is the snapshot
 * of the children's Q taken when they are created; it feeds the belief-robustness bound Phi that
 * is computed on every sampling visit and kept as last_phi().
 */
template <concepts::Traits Traits>
class SamplingNode : public NodeBase<Traits> {
 public:
  using Base = NodeBase<Traits>;
  using InfoSet = Traits::InfoSet;
  using Types = Traits::Types;
  using IntervalArray = Types::IntervalArray;
  using IntervalArrayVec = Types::IntervalArrayVec;
  using LocalDistribution = Types::LocalDistribution;
  using SearchContext = ismcts::SearchContext<Traits>;
  using Node = ismcts::Node<Traits>;
  using node_uptr_t = std::unique_ptr<Node>;

  // Throws if the hidden-value mask of info_set has no legal value, or if info_set is terminal.
  SamplingNode(const InfoSet& info_set, const IntervalArray& Q);

  void visit(SearchContext& context);

  const hidden_value_mask_t& mask() const { return mask_; }
  int num_hidden_values() const { return mask_.size(); }
  const std::vector<hidden_value_t>& legal_values() const { return legal_values_; }

  // Returns nullptr before expansion and for illegal hidden values.
  const Node* child(hidden_value_t h) const { return child_ptr(h); }
  Node* child(hidden_value_t h) { return child_ptr(h); }

  // Valid only after expansion. Indexed by hidden value; zero at illegal hidden values.
  const LocalDistribution& H() const { return H_; }
  const IntervalArrayVec& Qc() const { return Qc_; }
  const IntervalArray& V() const { return V_; }

  // true iff the masked belief was too small and H fell back to uniform
  bool used_uniform_fallback() const { return used_uniform_fallback_; }

  // Most recent sample and its Phi bound; empty until the first post-expansion visit.
  const std::optional<hidden_value_t>& last_sample() const { return last_sample_; }
  const std::optional<IntervalArray>& last_phi() const { return last_phi_; }

 private:
  Node* child_ptr(hidden_value_t h) const;

  void expand(SearchContext& context);
  hidden_value_t sample(SearchContext& context);

  const hidden_value_mask_t mask_;
  const std::vector<hidden_value_t> legal_values_;
  std::vector<node_uptr_t> children_;

  LocalDistribution H_;
  IntervalArray V_;
  IntervalArrayVec Qc_;
  bool used_uniform_fallback_ = false;

  // H_ and Qc_ restricted to legal_values_, in the same order
  LocalDistribution legal_H_;
  IntervalArrayVec legal_Qc_;

  std::optional<hidden_value_t> last_sample_;
  std::optional<IntervalArray> last_phi_;
};

}  // namespace ismcts

#include "inline/ismcts/SamplingNode.inl"
