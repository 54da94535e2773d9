#include "ismcts/SearchParams.hpp"

#include "util/Asserts.hpp"
#include "util/BoostUtil.hpp"

#include <boost/program_options.hpp>

namespace ismcts {

inline auto SearchParams::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("Search options");

  return desc
    .template add_option<"cpuct", 'c'>(po2::default_value("{:.2f}", &cPUCT), "cPUCT value")
    .template add_option<"phi-eps">(po2::default_value("{:.3f}", &phi_eps),
                                    "belief mass the adversary may move when computing Phi")
    .template add_hidden_option<"belief-mass-threshold">(
      po2::default_value("{:g}", &belief_mass_threshold),
      "masked beliefs with less mass than this fall back to uniform");
}

inline void SearchParams::validate() const {
  CLEAN_ASSERT(cPUCT >= 0, "cPUCT must be non-negative (got {})", cPUCT);
  CLEAN_ASSERT(phi_eps >= 0 && phi_eps <= 1, "phi-eps must lie in [0, 1] (got {})", phi_eps);
  CLEAN_ASSERT(belief_mass_threshold > 0, "belief-mass-threshold must be positive (got {})",
               belief_mass_threshold);
}

}  // namespace ismcts
