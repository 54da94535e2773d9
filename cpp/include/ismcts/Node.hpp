#pragma once

#include "ismcts/BasicTypes.hpp"
#include "ismcts/DecisionNode.hpp"
#include "ismcts/NodeBase.hpp"
#include "ismcts/SamplingNode.hpp"
#include "ismcts/SearchContext.hpp"
#include "ismcts/concepts/TraitsConcept.hpp"

#include <memory>
#include <variant>

namespace ismcts {

/*
 * Node is a closed tagged union over DecisionNode and SamplingNode. Parents own their children as
 * std::unique_ptr<Node>, and visit() dispatches to the concrete kind.
 *
 * The members common to both kinds are reachable through base().
 */
template <concepts::Traits Traits>
class Node {
 public:
  using InfoSet = Traits::InfoSet;
  using IntervalArray = Traits::Types::IntervalArray;
  using DecisionNode = ismcts::DecisionNode<Traits>;
  using SamplingNode = ismcts::SamplingNode<Traits>;
  using NodeBase = ismcts::NodeBase<Traits>;
  using SearchContext = ismcts::SearchContext<Traits>;
  using variant_t = std::variant<DecisionNode, SamplingNode>;

  static std::unique_ptr<Node> make_decision(const InfoSet& info_set, const IntervalArray& Q);
  static std::unique_ptr<Node> make_sampling(const InfoSet& info_set, const IntervalArray& Q);

  Node(const Node&) = delete;
  Node& operator=(const Node&) = delete;

  node_kind_t kind() const { return node_kind_t(variant_.index()); }
  bool is_decision() const { return kind() == kDecisionNode; }
  bool is_sampling() const { return kind() == kSamplingNode; }

  // Throw if the node is of the other kind.
  const DecisionNode& as_decision() const;
  DecisionNode& as_decision();
  const SamplingNode& as_sampling() const;
  SamplingNode& as_sampling();

  const NodeBase& base() const;

  const InfoSet& info_set() const { return base().info_set(); }
  const IntervalArray& Q() const { return base().Q(); }
  int N() const { return base().N(); }
  bool is_terminal() const { return base().is_terminal(); }
  bool is_expanded() const { return base().is_expanded(); }

  void visit(SearchContext& context);

 private:
  template <typename Kind>
  Node(std::in_place_type_t<Kind> kind, const InfoSet& info_set, const IntervalArray& Q)
      : variant_(kind, info_set, Q) {}

  variant_t variant_;
};

}  // namespace ismcts

#include "inline/ismcts/Node.inl"
