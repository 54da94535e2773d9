#pragma once

#include "ismcts/BasicTypes.hpp"
#include "ismcts/concepts/TraitsConcept.hpp"

#include <optional>

namespace ismcts {

// Object hierarchy:
//
// ismcts::NodeBase<Traits>
// ├── ismcts::DecisionNode<Traits>
// └── ismcts::SamplingNode<Traits>
//
// ismcts::Node<Traits> is a tagged union over the two node kinds. It is what parents own.
//
// NodeBase holds the members common to both kinds: the information set, the acting seat, the
// terminal outcome, the value interval Q, the visit count N, and the expansion state.
template <concepts::Traits Traits>
class NodeBase {
 public:
  using InfoSet = Traits::InfoSet;
  using Types = Traits::Types;
  using ValueArray = Types::ValueArray;
  using IntervalArray = Types::IntervalArray;

  // Q is the seed interval provided by the parent's evaluation. For a terminal information set it
  // is ignored and Q is pinned to the terminal outcome instead.
  NodeBase(const InfoSet& info_set, const IntervalArray& Q);

  const InfoSet& info_set() const { return info_set_; }
  seat_index_t active_seat() const { return active_seat_; }
  const std::optional<ValueArray>& terminal_outcome() const { return terminal_outcome_; }
  bool is_terminal() const { return terminal_outcome_.has_value(); }
  bool is_expanded() const { return expansion_state_ == kExpanded; }
  expansion_state_t expansion_state() const { return expansion_state_; }

  const IntervalArray& Q() const { return Q_; }
  int N() const { return N_; }

 protected:
  void set_Q(const IntervalArray& Q);

  const InfoSet info_set_;
  const seat_index_t active_seat_;
  const std::optional<ValueArray> terminal_outcome_;

  IntervalArray Q_;
  int N_ = 0;
  expansion_state_t expansion_state_ = kUnexpanded;
};

}  // namespace ismcts

#include "inline/ismcts/NodeBase.inl"
