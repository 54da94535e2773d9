#pragma once

#include "ismcts/DecisionNode.hpp"
#include "ismcts/Node.hpp"
#include "ismcts/SearchContext.hpp"
#include "ismcts/SearchParams.hpp"
#include "ismcts/concepts/TraitsConcept.hpp"

#include <memory>
#include <random>

namespace ismcts {

/*
 * Entry point of the search. A Tree owns the root DecisionNode. It refers to, but does not own, the
 * evaluator and the prng; both must outlive the Tree.
 *
 * Usage:
 *
 * ismcts::Tree<Traits> tree(evaluator, info_set, params, prng);
 * for (int i = 0; i < num_visits; ++i) {
 *   tree.visit();
 * }
 * const auto& root = tree.root();  // root.PURE(), root.MIXED(), root.Q(), ...
 */
template <concepts::Traits Traits>
class Tree {
 public:
  using InfoSet = Traits::InfoSet;
  using Evaluator = Traits::Evaluator;
  using Types = Traits::Types;
  using Node = ismcts::Node<Traits>;
  using DecisionNode = ismcts::DecisionNode<Traits>;
  using SearchContext = ismcts::SearchContext<Traits>;

  // Throws util::CleanException if params is invalid.
  Tree(Evaluator& evaluator, const InfoSet& root_info_set, const SearchParams& params,
       std::mt19937& prng);

  // Runs one simulation from the root.
  void visit();

  const DecisionNode& root() const { return root_->as_decision(); }
  const Node& root_node() const { return *root_; }
  const SearchParams& params() const { return params_; }

 private:
  Evaluator& evaluator_;
  const SearchParams params_;
  std::mt19937& prng_;
  std::unique_ptr<Node> root_;
};

}  // namespace ismcts

#include "inline/ismcts/Tree.inl"
