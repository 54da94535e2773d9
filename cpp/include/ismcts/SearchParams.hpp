#pragma once

#include "ismcts/Constants.hpp"

namespace ismcts {

/*
 * Tunable constants of the search. All of these are fixed for the lifetime of a Tree.
 */
struct SearchParams {
  auto make_options_description();
  bool operator==(const SearchParams& other) const = default;

  // Throws util::CleanException if any parameter is out of range.
  void validate() const;

  // Exploration constant C of the interval-PUCT selection rule.
  float cPUCT = kDefaultCPUCT;

  // Amount of belief mass the adversary may move when SamplingNode computes Phi. Must lie in
  // [0, 1].
  float phi_eps = kDefaultPhiEps;

  // If a masked belief sums to less than this, SamplingNode falls back to the uniform distribution
  // over the legal hidden values.
  float belief_mass_threshold = kDefaultBeliefMassThreshold;
};

}  // namespace ismcts

#include "inline/ismcts/SearchParams.inl"
