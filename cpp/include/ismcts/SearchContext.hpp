#pragma once

#include "ismcts/SearchParams.hpp"
#include "ismcts/concepts/TraitsConcept.hpp"

#include <random>

namespace ismcts {

// Everything a node visit needs beyond the node itself. Built by Tree::visit() and passed down the
// path by reference.
template <concepts::Traits Traits>
struct SearchContext {
  using Evaluator = Traits::Evaluator;

  Evaluator& evaluator;
  const SearchParams& params;
  std::mt19937& prng;
};

}  // namespace ismcts
