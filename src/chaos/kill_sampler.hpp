#pragma once

#include <cstddef>
#include <random>
#include <vector>

namespace resilab::chaos {

// Kill count for one window: 0 when `p_fail <= 0` or the population is
// empty, otherwise `min(n, max(1, round(n * p_fail)))`.
//
// This is the only place the failure law lives. The chaos executor and the
// reliability estimator both call it.
std::size_t ComputeKillCount(std::size_t population, double p_fail);

// Draws `count` distinct indices in [0, population) uniformly without
// replacement using a partial Fisher-Yates shuffle over `scratch`.
//
// `scratch` is caller-owned so hot loops (Monte Carlo trials) reuse one
// allocation. On return the first `count` entries of `scratch` hold the
// kill set.
void DrawKillIndices(std::size_t population, std::size_t count, std::mt19937_64& rng,
                     std::vector<std::size_t>& scratch);

// Convenience wrapper: ComputeKillCount + DrawKillIndices.
std::vector<std::size_t> DrawKillSet(std::size_t population, double p_fail,
                                     std::mt19937_64& rng);

// Fresh generator seeded from the OS entropy source. Runs are intentionally
// not reproducible.
std::mt19937_64 MakeUnseededGenerator();

} // namespace resilab::chaos
