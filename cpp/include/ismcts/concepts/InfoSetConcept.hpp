#pragma once

#include "ismcts/BasicTypes.hpp"
#include "ismcts/Types.hpp"

#include <concepts>
#include <optional>
#include <vector>

namespace ismcts {

namespace concepts {

/*
 * An InfoSet is a game state as perceived by the acting player. The search treats it as an
 * immutable value: every transition returns a new instance, and each tree node owns a copy.
 *
 * - kNumPlayers: number of players, a compile-time constant.
 * - current_player(): the seat that acts at this information set.
 * - terminal_outcome(): one value per player if the game has ended, std::nullopt otherwise.
 * - has_hidden_info(): true iff some hidden value is still unresolved.
 * - legal_actions(): the public actions available to current_player(), in a fixed order.
 * - hidden_value_mask(): bit h is set iff hidden value h is consistent with this information set.
 * - apply(action): the information set after current_player() takes action.
 * - instantiate(h): the information set after hidden value h is revealed.
 */
template <class I>
concept InfoSet = requires(const I& info_set, action_t action, hidden_value_t hidden_value) {
  requires std::same_as<decltype(I::kNumPlayers), const int>;
  requires I::kNumPlayers > 0;
  requires std::copy_constructible<I>;

  { info_set.current_player() } -> std::convertible_to<seat_index_t>;
  {
    info_set.terminal_outcome()
  } -> std::same_as<std::optional<typename Types<I::kNumPlayers>::ValueArray>>;
  { info_set.has_hidden_info() } -> std::same_as<bool>;
  { info_set.legal_actions() } -> std::same_as<std::vector<action_t>>;
  { info_set.hidden_value_mask() } -> std::same_as<hidden_value_mask_t>;
  { info_set.apply(action) } -> std::same_as<I>;
  { info_set.instantiate(hidden_value) } -> std::same_as<I>;
};

}  // namespace concepts

}  // namespace ismcts
