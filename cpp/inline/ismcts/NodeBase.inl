#include "ismcts/NodeBase.hpp"

#include "util/Asserts.hpp"

namespace ismcts {

template <concepts::Traits Traits>
NodeBase<Traits>::NodeBase(const InfoSet& info_set, const IntervalArray& Q)
    : info_set_(info_set),
      active_seat_(info_set.current_player()),
      terminal_outcome_(info_set.terminal_outcome()) {
  if (terminal_outcome_) {
    Q_ = Types::to_interval_array(*terminal_outcome_);
  } else {
    Q_ = Q;
  }
  RELEASE_ASSERT(Types::is_valid(Q_), "NodeBase: invalid initial Q {}", Types::to_string(Q_));
}

template <concepts::Traits Traits>
void NodeBase<Traits>::set_Q(const IntervalArray& Q) {
  DEBUG_ASSERT(Types::is_valid(Q), "NodeBase::set_Q(): invalid Q {}", Types::to_string(Q));
  DEBUG_ASSERT(!is_terminal(), "NodeBase::set_Q(): terminal Q is immutable");
  Q_ = Q;
}

}  // namespace ismcts
