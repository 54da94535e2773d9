#include "ismcts/Node.hpp"

#include "util/Asserts.hpp"

namespace ismcts {

template <concepts::Traits Traits>
std::unique_ptr<Node<Traits>> Node<Traits>::make_decision(const InfoSet& info_set,
                                                          const IntervalArray& Q) {
  return std::unique_ptr<Node>(new Node(std::in_place_type<DecisionNode>, info_set, Q));
}

template <concepts::Traits Traits>
std::unique_ptr<Node<Traits>> Node<Traits>::make_sampling(const InfoSet& info_set,
                                                          const IntervalArray& Q) {
  return std::unique_ptr<Node>(new Node(std::in_place_type<SamplingNode>, info_set, Q));
}

template <concepts::Traits Traits>
const typename Node<Traits>::DecisionNode& Node<Traits>::as_decision() const {
  const DecisionNode* node = std::get_if<DecisionNode>(&variant_);
  RELEASE_ASSERT(node != nullptr, "Node::as_decision(): node is a sampling node");
  return *node;
}

template <concepts::Traits Traits>
typename Node<Traits>::DecisionNode& Node<Traits>::as_decision() {
  DecisionNode* node = std::get_if<DecisionNode>(&variant_);
  RELEASE_ASSERT(node != nullptr, "Node::as_decision(): node is a sampling node");
  return *node;
}

template <concepts::Traits Traits>
const typename Node<Traits>::SamplingNode& Node<Traits>::as_sampling() const {
  const SamplingNode* node = std::get_if<SamplingNode>(&variant_);
  RELEASE_ASSERT(node != nullptr, "Node::as_sampling(): node is a decision node");
  return *node;
}

template <concepts::Traits Traits>
typename Node<Traits>::SamplingNode& Node<Traits>::as_sampling() {
  SamplingNode* node = std::get_if<SamplingNode>(&variant_);
  RELEASE_ASSERT(node != nullptr, "Node::as_sampling(): node is a decision node");
  return *node;
}

template <concepts::Traits Traits>
const typename Node<Traits>::NodeBase& Node<Traits>::base() const {
  return std::visit([](const auto& node) -> const NodeBase& { return node; }, variant_);
}

template <concepts::Traits Traits>
void Node<Traits>::visit(SearchContext& context) {
  std::visit([&](auto& node) { node.visit(context); }, variant_);
}

}  // namespace ismcts
