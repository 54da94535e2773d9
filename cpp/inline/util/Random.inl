#include "util/Random.hpp"

#include "util/Asserts.hpp"
#include "util/BoostUtil.hpp"

#include <ctime>

namespace util {

inline auto Random::Params::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("Random options");

  return desc.template add_option<"seed">(po::value<int>(&seed)->default_value(seed),
                                          "random seed (default: 0 means seed with current time)");
}

inline void Random::init(const Params& params) {
  if (params.seed) {
    set_seed(params.seed);
  }
}

inline void Random::set_seed(int seed) { default_prng().seed(seed); }

template <std::integral T, std::integral U>
inline auto Random::uniform_sample(std::mt19937& prng, T lower, U upper) {
  RELEASE_ASSERT(lower < upper, "Random::uniform_sample() - invalid range [{}, {})", lower, upper);
  using V = std::common_type_t<T, U>;
  std::uniform_int_distribution<V> dist{(V)lower, (V)(upper - 1)};
  return dist(prng);
}

template <std::integral T, std::integral U>
inline auto Random::uniform_sample(T lower, U upper) {
  return uniform_sample(default_prng(), lower, upper);
}

template <typename FloatType>
FloatType Random::uniform_real(std::mt19937& prng, FloatType left, FloatType right) {
  RELEASE_ASSERT(left < right, "Random::uniform_real() - invalid range [{}, {})", left, right);
  std::uniform_real_distribution<FloatType> dist(left, right);
  return dist(prng);
}

template <typename FloatType>
FloatType Random::uniform_real(FloatType left, FloatType right) {
  return uniform_real(default_prng(), left, right);
}

template <typename InputIt>
inline int Random::weighted_sample(std::mt19937& prng, InputIt begin, InputIt end) {
  std::discrete_distribution<int> dist(begin, end);
  return dist(prng);
}

template <typename InputIt>
inline int Random::weighted_sample(InputIt begin, InputIt end) {
  return weighted_sample(default_prng(), begin, end);
}

inline std::mt19937& Random::default_prng() {
  static std::mt19937 prng(std::time(nullptr));
  return prng;
}

}  // namespace util
