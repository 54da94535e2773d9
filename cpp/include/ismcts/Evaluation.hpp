#pragma once

#include "ismcts/Types.hpp"

namespace ismcts {

/*
 * Output of Evaluator::evaluate_actions().
 *
 * P: prior over the legal actions, indexed in legal_actions() order.
 * V: value estimate of the evaluated information set.
 * Vc: value estimate of each action's child, used to seed the child's Q before the child is itself
 *     expanded. A scalar estimate can be passed through Types::to_interval_array().
 */
template <int kNumPlayers>
struct ActionEvaluation {
  using Types = ismcts::Types<kNumPlayers>;
  using IntervalArray = Types::IntervalArray;
  using IntervalArrayVec = Types::IntervalArrayVec;
  using LocalDistribution = Types::LocalDistribution;

  // Throws util::Exception, naming caller, if the sizes do not match num_actions or if any value is
  // not a valid interval.
  void validate(const char* caller, int num_actions) const;

  LocalDistribution P;
  IntervalArray V;
  IntervalArrayVec Vc;
};

/*
 * Output of Evaluator::evaluate_hidden().
 *
 * H: belief over hidden values, indexed by hidden value (same length as hidden_value_mask()). It
 *    need not respect the mask; the search masks and renormalizes it.
 * V: value estimate of the evaluated information set.
 * Vc: value estimate per hidden value. Entries for illegal hidden values are ignored.
 */
template <int kNumPlayers>
struct HiddenEvaluation {
  using Types = ismcts::Types<kNumPlayers>;
  using IntervalArray = Types::IntervalArray;
  using IntervalArrayVec = Types::IntervalArrayVec;
  using LocalDistribution = Types::LocalDistribution;

  // Like ActionEvaluation::validate(), but only checks the Vc entries whose bit is set in mask.
  void validate(const char* caller, const hidden_value_mask_t& mask) const;

  LocalDistribution H;
  IntervalArray V;
  IntervalArrayVec Vc;
};

}  // namespace ismcts

#include "inline/ismcts/Evaluation.inl"
