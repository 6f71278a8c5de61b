#pragma once
#include "../config/config.hpp"
#include "../core/fleet.hpp"
#include "../core/opaque.hpp"
#include "../report/report.hpp"
#include <ostream>
#include <nlohmann/json.hpp>
using json = nlohmann::json;

/**
 * @brief Existential walkthrough, text output
 *
 * Prints the fixed fleet, a random fleet built from cfg, and the totals
 * computed only through the capability set.
 */
inline void print_existential(std::ostream& os, const DemoConfig& cfg) {
  os << "== Existential walkthrough (runtime dispatch) ==" << '\n';

  os << "Fixed fleet:" << '\n';
  for (const auto& instrument : make_fleet()) {
    os << "  ";
    print_instrument(os, instrument);
  }

  Fleet fleet = make_random_fleet(cfg.fleet_size, cfg.seed);
  os << "Random fleet (" << fleet.size() << " picks):" << '\n';
  for (const auto& instrument : fleet) {
    os << "  ";
    print_instrument(os, instrument);
  }

  os << "Total magnitude: " << format_magnitude(total_magnitude(fleet)) << '\n';
  os << "Pulsed instruments: " << count_pulsed(fleet) << '\n';
}

/**
 * @brief Opaque walkthrough, text output
 *
 * Calls default_instrument() cfg.repeat times. Every line is identical.
 */
inline void print_opaque(std::ostream& os, const DemoConfig& cfg) {
  os << "== Opaque walkthrough (static dispatch) ==" << '\n';
  for (int i = 0; i < cfg.repeat; ++i) {
    os << "  call " << (i + 1) << ": ";
    print_instrument(os, default_instrument());
  }
  os << "  paired: ";
  print_instrument(os, paired_instrument());
}

inline void run_text(std::ostream& os, const DemoConfig& cfg) {
  print_existential(os, cfg);
  os << '\n';
  print_opaque(os, cfg);
}

/**
 * @brief Both walkthroughs as a single JSON document
 */
inline json run_json(const DemoConfig& cfg) {
  Fleet fleet = make_random_fleet(cfg.fleet_size, cfg.seed);

  json calls = json::array();
  for (int i = 0; i < cfg.repeat; ++i) {
    calls.push_back(instrument_to_json(default_instrument()));
  }

  return json{
      {"config", cfg.to_json()},
      {"existential", {{"fixed", make_fleet()},
                       {"random", fleet},
                       {"total_magnitude", total_magnitude(fleet)},
                       {"pulsed_count", count_pulsed(fleet)}}},
      {"opaque", {{"calls", calls},
                  {"paired", instrument_to_json(paired_instrument())}}}};
}
