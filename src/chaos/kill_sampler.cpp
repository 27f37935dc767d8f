#include "chaos/kill_sampler.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <utility>

namespace resilab::chaos {

std::size_t ComputeKillCount(std::size_t population, double p_fail) {
  if (population == 0U || !(p_fail > 0.0)) {
    return 0U;
  }
  const double scaled = static_cast<double>(population) * std::min(p_fail, 1.0);
  const auto rounded = static_cast<std::size_t>(std::llround(scaled));
  return std::min(population, std::max<std::size_t>(1U, rounded));
}

void DrawKillIndices(std::size_t population, std::size_t count, std::mt19937_64& rng,
                     std::vector<std::size_t>& scratch) {
  scratch.resize(population);
  std::iota(scratch.begin(), scratch.end(), std::size_t{0});
  count = std::min(count, population);
  for (std::size_t i = 0; i < count; ++i) {
    std::uniform_int_distribution<std::size_t> pick(i, population - 1U);
    std::swap(scratch[i], scratch[pick(rng)]);
  }
}

std::vector<std::size_t> DrawKillSet(std::size_t population, double p_fail,
                                     std::mt19937_64& rng) {
  const std::size_t count = ComputeKillCount(population, p_fail);
  std::vector<std::size_t> scratch;
  DrawKillIndices(population, count, rng, scratch);
  scratch.resize(count);
  return scratch;
}

std::mt19937_64 MakeUnseededGenerator() {
  std::random_device device;
  std::seed_seq seed{device(), device(), device(), device()};
  return std::mt19937_64(seed);
}

} // namespace resilab::chaos
