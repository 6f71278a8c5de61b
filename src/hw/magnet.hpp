#pragma once
#include <string>

/**
 * @brief Steering magnet held at a fixed DC current
 *
 * Second Instrument implementer. Reports a continuous (not pulsed)
 * excitation of 200 A.
 */
struct Magnet {
  bool is_pulsed() const { return false; }
  double magnitude() const { return 200.0; }  // A

  static std::string type_name() { return "Magnet"; }
  static std::string units() { return "A"; }
};
