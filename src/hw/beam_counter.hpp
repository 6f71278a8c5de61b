#pragma once
#include <string>

/**
 * @brief Beam intensity counter with a fixed, pulsed readout
 *
 * Satisfies the Instrument contract (see instrument.hpp) without inheriting
 * from anything. Always reports a pulsed beam of 80000 counts.
 */
struct BeamCounter {
  bool is_pulsed() const { return true; }
  double magnitude() const { return 80000.0; }

  static std::string type_name() { return "BeamCounter"; }
  static std::string units() { return "counts"; }  ///< Not part of the contract
};
