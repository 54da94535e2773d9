#pragma once

#include "ismcts/concepts/EvaluatorConcept.hpp"
#include "ismcts/concepts/InfoSetConcept.hpp"

namespace ismcts {

namespace concepts {

template <class T>
concept Traits = requires {
  requires InfoSet<typename T::InfoSet>;
  requires Evaluator<typename T::Evaluator, typename T::InfoSet>;
  requires T::kNumPlayers == T::InfoSet::kNumPlayers;
};

}  // namespace concepts

}  // namespace ismcts
