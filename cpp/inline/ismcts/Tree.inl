#include "ismcts/Tree.hpp"

#include "util/LoggingUtil.hpp"

namespace ismcts {

template <concepts::Traits Traits>
Tree<Traits>::Tree(Evaluator& evaluator, const InfoSet& root_info_set, const SearchParams& params,
                   std::mt19937& prng)
    : evaluator_(evaluator), params_(params), prng_(prng) {
  params_.validate();
  root_ = Node::make_decision(root_info_set, Types::zero_interval_array());
}

template <concepts::Traits Traits>
void Tree<Traits>::visit() {
  SearchContext context{evaluator_, params_, prng_};
  root_->visit(context);
  LOG_TRACE("Tree::visit(): root N={} Q={}", root_->N(), Types::to_string(root_->Q()));
}

}  // namespace ismcts
