#pragma once

#include "ismcts/Evaluation.hpp"
#include "ismcts/concepts/InfoSetConcept.hpp"

#include <concepts>

namespace ismcts {

namespace concepts {

/*
 * An Evaluator is the learned model consulted when a node is expanded. Both methods are treated as
 * pure functions of the information set, and the search calls each at most once per node.
 */
template <class E, class I>
concept Evaluator = InfoSet<I> && requires(E& evaluator, const I& info_set) {
  { evaluator.evaluate_actions(info_set) } -> std::same_as<ActionEvaluation<I::kNumPlayers>>;
  { evaluator.evaluate_hidden(info_set) } -> std::same_as<HiddenEvaluation<I::kNumPlayers>>;
};

}  // namespace concepts

}  // namespace ismcts
