#include "util/Asserts.hpp"
#include "util/BoostUtil.hpp"
#include "util/CppUtil.hpp"
#include "util/EigenUtil.hpp"
#include "util/Exception.hpp"
#include "util/GTestUtil.hpp"
#include "util/LoggingUtil.hpp"
#include "util/Random.hpp"

#include <Eigen/Core>
#include <gtest/gtest.h>

#include <array>
#include <memory>
#include <random>
#include <string>
#include <vector>

TEST(Random, uniform_sample) {
  std::mt19937 prng(1);
  std::array<int, 5> counts = {};

  constexpr int N = 10000;
  for (int i = 0; i < N; ++i) {
    int k = util::Random::uniform_sample(prng, 2, 7);
    ASSERT_GE(k, 2);
    ASSERT_LT(k, 7);
    counts[k - 2]++;
  }
  for (int count : counts) {
    EXPECT_NEAR(count * 1.0 / N, 0.2, 0.02);
  }

  EXPECT_THROW(util::Random::uniform_sample(prng, 3, 3), util::Exception);
}

TEST(Random, uniform_real) {
  std::mt19937 prng(1);
  for (int i = 0; i < 1000; ++i) {
    float x = util::Random::uniform_real(prng, -0.5f, 0.25f);
    EXPECT_GE(x, -0.5f);
    EXPECT_LT(x, 0.25f);
  }
  EXPECT_THROW(util::Random::uniform_real(prng, 1.0, 0.0), util::Exception);
}

TEST(Random, weighted_sample) {
  std::mt19937 prng(1);
  std::array<float, 4> weights = {1, 0, 3, 0};
  std::array<int, 4> counts = {};

  constexpr int N = 10000;
  for (int i = 0; i < N; ++i) {
    counts[util::Random::weighted_sample(prng, weights.begin(), weights.end())]++;
  }
  EXPECT_EQ(counts[1], 0);
  EXPECT_EQ(counts[3], 0);
  EXPECT_NEAR(counts[0] * 1.0 / N, 0.25, 0.02);
  EXPECT_NEAR(counts[2] * 1.0 / N, 0.75, 0.02);
}

TEST(Random, same_seed_same_stream) {
  std::mt19937 prng1(42);
  std::mt19937 prng2(42);
  for (int i = 0; i < 100; ++i) {
    EXPECT_EQ(util::Random::uniform_sample(prng1, 0, 1000),
              util::Random::uniform_sample(prng2, 0, 1000));
  }

  util::Random::set_seed(5);
  int a = util::Random::uniform_sample(0, 1000000);
  util::Random::set_seed(5);
  int b = util::Random::uniform_sample(0, 1000000);
  EXPECT_EQ(a, b);
}

TEST(eigen_util, normalize) {
  eigen_util::DArray array(4);
  array << 0, 1, 3, 0;

  EXPECT_TRUE(eigen_util::normalize(array));
  EXPECT_FLOAT_EQ(array(0), 0);
  EXPECT_FLOAT_EQ(array(1), 0.25);
  EXPECT_FLOAT_EQ(array(2), 0.75);
  EXPECT_FLOAT_EQ(array.sum(), 1);

  eigen_util::DArray tiny(2);
  tiny << 1e-9, 0;
  EXPECT_FALSE(eigen_util::normalize(tiny, 1e-6));
  EXPECT_FLOAT_EQ(tiny(0), 1e-9);  // left unchanged
}

TEST(eigen_util, argsort) {
  eigen_util::FArray<5> array;
  array << 0.3, 0.1, 0.2, 0.1, 0.5;

  std::vector<int> expected = {1, 3, 2, 0, 4};  // ties keep index order
  EXPECT_EQ(eigen_util::argsort(array), expected);
}

TEST(eigen_util, argmax) {
  eigen_util::FArray<4> array;
  array << 0.3, 0.7, 0.1, 0.7;
  EXPECT_EQ(eigen_util::argmax(array), 1);

  eigen_util::DArray single(1);
  single << -2;
  EXPECT_EQ(eigen_util::argmax(single), 0);
}

TEST(eigen_util, to_string) {
  eigen_util::DArray array(2);
  array << 1, 0.5;
  EXPECT_EQ(eigen_util::to_string(array), "[1, 0.5]");

  Eigen::Array<float, 2, 2> matrix;
  matrix << 1, 2, 3, 4;
  EXPECT_EQ(eigen_util::to_string(matrix), "[[1, 2], [3, 4]]");
}

TEST(Exception, format) {
  util::Exception e("bad index {} (size={})", 5, 3);
  EXPECT_EQ(std::string(e.what()), "bad index 5 (size=3)");
}

TEST(Asserts, release_assert) {
  EXPECT_NO_THROW(RELEASE_ASSERT(1 + 1 == 2));
  EXPECT_THROW(RELEASE_ASSERT(1 + 1 == 3), util::ReleaseAssertionError);

  try {
    int x = 7;
    RELEASE_ASSERT(x < 5, "x={} too large", x);
    FAIL() << "RELEASE_ASSERT did not throw";
  } catch (const util::Exception& e) {
    std::string what = e.what();
    EXPECT_NE(what.find("RELEASE_ASSERT failed: x=7 too large"), std::string::npos) << what;
    EXPECT_NE(what.find("UnitTests.cpp"), std::string::npos) << what;
  }
}

TEST(Asserts, clean_assert) {
  EXPECT_THROW(CLEAN_ASSERT(false, "user error"), util::CleanException);
}

TEST(Asserts, debug_assert) {
  if (IS_DEFINED(DEBUG_BUILD)) {
    EXPECT_THROW(DEBUG_ASSERT(false), util::DebugAssertionError);
  } else {
    EXPECT_NO_THROW(DEBUG_ASSERT(false));
  }
}

#define ISMCTS_TEST_MACRO_ON 1

TEST(CppUtil, is_defined) {
  static_assert(IS_DEFINED(ISMCTS_TEST_MACRO_ON));
  static_assert(!IS_DEFINED(ISMCTS_TEST_MACRO_UNSET));
}

TEST(CppUtil, sequences) {
  using Seq = util::int_sequence<1, 3, 5>;
  static_assert(util::is_int_sequence_v<Seq>);
  static_assert(util::int_sequence_contains_v<Seq, 3>);
  static_assert(!util::int_sequence_contains_v<Seq, 2>);
  static_assert(
    std::is_same_v<util::concat_int_sequence_t<Seq, util::int_sequence<7>>,
                   util::int_sequence<1, 3, 5, 7>>);

  using StrSeq = util::StringLiteralSequence<"foo", "bar">;
  static_assert(util::string_literal_sequence_contains_v<StrSeq, "bar">);
  static_assert(!util::string_literal_sequence_contains_v<StrSeq, "baz">);
  static_assert(util::no_overlap_v<StrSeq, util::StringLiteralSequence<"baz">>);
  static_assert(!util::no_overlap_v<StrSeq, util::StringLiteralSequence<"baz", "foo">>);
}

TEST(BoostUtil, parse_args) {
  namespace po2 = boost_util::program_options;

  int seed = 0;
  float x = 0.5;
  bool flag = false;

  po2::options_description raw_desc("Test options");
  auto desc = raw_desc.template add_option<"seed", 's'>(po2::default_value("{}", &seed), "seed")
                .template add_hidden_option<"x">(po2::default_value("{:.2f}", &x), "x")
                .template add_flag<"flag", "no-flag">(&flag, "enable", "disable");

  std::vector<std::string> args = {"-s", "17", "--x", "0.25", "--flag"};
  po2::parse_args(desc, args);
  EXPECT_EQ(seed, 17);
  EXPECT_FLOAT_EQ(x, 0.25);
  EXPECT_TRUE(flag);

  std::vector<std::string> unknown = {"--bogus"};
  EXPECT_THROW(po2::parse_args(desc, unknown), util::CleanException);
}

TEST(BoostUtil, default_value_text) {
  namespace po2 = boost_util::program_options;

  float x = 0.5;
  int n = 12;
  using value_ptr = std::unique_ptr<boost::program_options::value_semantic>;
  value_ptr x_value(po2::default_value("{:.2f}", &x));
  value_ptr n_value(po2::default_value("{}", &n, 7));
  EXPECT_EQ(x_value->name(), "arg (=0.50)");
  EXPECT_EQ(n_value->name(), "arg (=7)");
}

TEST(Logging, bad_level) {
  util::Logging::Params params;
  params.log_level = "chatty";
  EXPECT_THROW(util::Logging::init(params), util::CleanException);
}

int main(int argc, char** argv) { return launch_gtest(argc, argv); }
