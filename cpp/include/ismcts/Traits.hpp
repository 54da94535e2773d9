#pragma once

#include "ismcts/Evaluation.hpp"
#include "ismcts/Types.hpp"
#include "ismcts/concepts/EvaluatorConcept.hpp"
#include "ismcts/concepts/InfoSetConcept.hpp"

namespace ismcts {

template <concepts::InfoSet InfoSet_, concepts::Evaluator<InfoSet_> Evaluator_>
struct Traits {
  using InfoSet = InfoSet_;
  using Evaluator = Evaluator_;

  static constexpr int kNumPlayers = InfoSet::kNumPlayers;

  using Types = ismcts::Types<kNumPlayers>;
  using ActionEvaluation = ismcts::ActionEvaluation<kNumPlayers>;
  using HiddenEvaluation = ismcts::HiddenEvaluation<kNumPlayers>;
};

}  // namespace ismcts
