#pragma once

namespace ismcts {

constexpr int kNumBounds = 2;  // lower, upper

// Defaults for SearchParams
constexpr float kDefaultCPUCT = 1.0;
constexpr float kDefaultPhiEps = 0.05;
constexpr float kDefaultBeliefMassThreshold = 1e-6;

}  // namespace ismcts
