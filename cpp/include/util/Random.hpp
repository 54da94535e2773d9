#pragma once

#include <concepts>
#include <random>

/*
 * A wrapper around STL's random machinery.
 *
 * To initialize the default prng with a specific seed, call:
 *
 * util::Random::set_seed(seed);
 *
 * To add a cmdline option to set the seed, do:
 *
 * util::Random::Params random_params;
 *
 * namespace po2 = boost_util::program_options;
 * po2::options_description raw_desc("General options");
 * auto desc = raw_desc.add(random_params.make_options_description());
 * po2::parse_args(desc, ac, av);
 *
 * util::Random::init(random_params);
 *
 * Each of the random functions in this class has 2 variants: one that accepts a std::mt19937
 * reference as the first argument, and one that doesn't. The latter uses the default prng
 * (controlled by the seed set above). Library code should prefer the former, so that callers can
 * maintain independent, reproducible streams.
 */
namespace util {

class Random {
 public:
  struct Params {
    auto make_options_description();

    int seed = 0;
  };

  static void init(const Params&);

  static void set_seed(int seed);

  /*
   * Uniformly randomly picks a value in the half-open range [lower, upper).
   *
   * T and U should be integral types, and lower must be less than upper.
   */
  template <std::integral T, std::integral U>
  static auto uniform_sample(std::mt19937& prng, T lower, U upper);

  template <std::integral T, std::integral U>
  static auto uniform_sample(T lower, U upper);

  /*
   * Produces a random real value in the range [left, right).
   */
  template <typename FloatType>
  static FloatType uniform_real(std::mt19937& prng, FloatType left, FloatType right);

  template <typename FloatType>
  static FloatType uniform_real(FloatType left, FloatType right);

  /*
   * Given an array A of n values, produces a random integer on the interval [0, n), where integer i
   * is chosen with probability proportional to A[i].
   *
   * The begin/end of the array is passed in as the two arguments. The values must be non-negative
   * with a positive sum.
   *
   * Example:
   *
   * std::array<float, 3> arr = {1, 2, 3};
   * int k = util::Random::weighted_sample(prng, arr.begin(), arr.end());
   */
  template <typename InputIt>
  static int weighted_sample(std::mt19937& prng, InputIt begin, InputIt end);

  template <typename InputIt>
  static int weighted_sample(InputIt begin, InputIt end);

  static std::mt19937& default_prng();
};

}  // namespace util

#include "inline/util/Random.inl"
