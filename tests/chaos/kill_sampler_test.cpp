#include "chaos/kill_sampler.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstddef>
#include <random>
#include <set>
#include <vector>

using resilab::chaos::ComputeKillCount;

TEST_CASE("Kill count follows the rounded failure law", "[chaos][kill_sampler]") {
  REQUIRE(ComputeKillCount(10U, 0.3) == 3U);
  REQUIRE(ComputeKillCount(10U, 0.25) == 3U);
  REQUIRE(ComputeKillCount(10U, 1.0) == 10U);
  REQUIRE(ComputeKillCount(4U, 0.5) == 2U);
}

TEST_CASE("Kill count is zero without failure probability or population",
          "[chaos][kill_sampler]") {
  REQUIRE(ComputeKillCount(10U, 0.0) == 0U);
  REQUIRE(ComputeKillCount(0U, 0.5) == 0U);
  REQUIRE(ComputeKillCount(0U, 1.0) == 0U);
}

TEST_CASE("Any positive failure probability kills at least one service",
          "[chaos][kill_sampler]") {
  REQUIRE(ComputeKillCount(10U, 0.01) == 1U);
  REQUIRE(ComputeKillCount(1U, 0.1) == 1U);
}

TEST_CASE("Kill count never exceeds the population", "[chaos][kill_sampler]") {
  for (std::size_t n = 1; n <= 20U; ++n) {
    for (const double p : {0.05, 0.3, 0.5, 0.99, 1.0, 1.5}) {
      const std::size_t k = ComputeKillCount(n, p);
      REQUIRE(k >= 1U);
      REQUIRE(k <= n);
    }
  }
}

TEST_CASE("Drawn kill sets are distinct indices within the population",
          "[chaos][kill_sampler]") {
  std::mt19937_64 rng(7U);
  for (int trial = 0; trial < 200; ++trial) {
    const auto kills = resilab::chaos::DrawKillSet(12U, 0.4, rng);
    REQUIRE(kills.size() == 5U);
    const std::set<std::size_t> unique(kills.begin(), kills.end());
    REQUIRE(unique.size() == kills.size());
    for (const auto index : kills) {
      REQUIRE(index < 12U);
    }
  }
}

TEST_CASE("Every index is eventually drawn", "[chaos][kill_sampler]") {
  std::mt19937_64 rng(11U);
  std::vector<std::size_t> scratch;
  std::set<std::size_t> seen;
  for (int trial = 0; trial < 500; ++trial) {
    resilab::chaos::DrawKillIndices(8U, 2U, rng, scratch);
    REQUIRE(scratch.size() == 8U);
    seen.insert(scratch[0]);
    seen.insert(scratch[1]);
  }
  REQUIRE(seen.size() == 8U);
}

TEST_CASE("Zero failure probability draws an empty set", "[chaos][kill_sampler]") {
  auto rng = resilab::chaos::MakeUnseededGenerator();
  REQUIRE(resilab::chaos::DrawKillSet(10U, 0.0, rng).empty());
}
