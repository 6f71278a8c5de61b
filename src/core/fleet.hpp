#pragma once
#include "any_instrument.hpp"
#include "../hw/beam_counter.hpp"
#include "../hw/magnet.hpp"
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <numeric>
#include <random>
#include <vector>

/**
 * @brief Heterogeneous collection of instruments
 *
 * Elements share the Instrument capability set but may differ in concrete
 * type. Traversals only see what AnyInstrument exposes.
 */
using Fleet = std::vector<AnyInstrument>;

/**
 * @brief One of each known implementer, in declaration order
 */
inline Fleet make_fleet() {
  return Fleet{BeamCounter{}, Magnet{}};
}

/**
 * @brief Pick one known implementer uniformly at random
 *
 * The caller receives an AnyInstrument. Which concrete type it holds is only
 * known at runtime.
 */
template<class Rng>
AnyInstrument pick_random_instrument(Rng& rng) {
  std::uniform_int_distribution<int> choice(0, 1);
  if (choice(rng) == 0) {
    return BeamCounter{};
  }
  return Magnet{};
}

/**
 * @brief Build a fleet of random picks
 * @param size Number of instruments
 * @param seed Random seed (0 = use random device)
 */
inline Fleet make_random_fleet(std::size_t size, std::uint64_t seed = 0) {
  std::mt19937_64 rng(seed == 0 ? std::random_device{}() : seed);
  Fleet fleet;
  fleet.reserve(size);
  for (std::size_t i = 0; i < size; ++i) {
    fleet.push_back(pick_random_instrument(rng));
  }
  return fleet;
}

inline double total_magnitude(const Fleet& fleet) {
  return std::accumulate(fleet.begin(), fleet.end(), 0.0,
                         [](double sum, const AnyInstrument& i) { return sum + i.magnitude(); });
}

inline std::size_t count_pulsed(const Fleet& fleet) {
  return static_cast<std::size_t>(
      std::count_if(fleet.begin(), fleet.end(),
                    [](const AnyInstrument& i) { return i.is_pulsed(); }));
}
