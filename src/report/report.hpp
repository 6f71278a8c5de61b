#pragma once
#include "../hw/instrument.hpp"
#include "../core/any_instrument.hpp"
#include <iomanip>
#include <ostream>
#include <sstream>
#include <string>
#include <nlohmann/json.hpp>
using json = nlohmann::json;

/**
 * @brief Console and JSON rendering of instruments
 *
 * Text format, one line per instrument:
 *   <TypeName>: pulsed=<true|false> magnitude=<value>
 * with the magnitude in fixed notation, one decimal (80000.0, 200.0).
 */

inline std::string format_magnitude(double value) {
  std::ostringstream os;
  os << std::fixed << std::setprecision(1) << value;
  return os.str();
}

inline std::string format_line(const std::string& label, bool pulsed, double magnitude) {
  return label + ": pulsed=" + (pulsed ? "true" : "false") +
         " magnitude=" + format_magnitude(magnitude);
}

/**
 * @brief Line for a statically known instrument type
 */
template<class I>
std::string instrument_line(const I& instrument) {
  static_assert(is_instrument_v<I>, "instrument_line requires an Instrument");
  return format_line(instrument_label(instrument), instrument.is_pulsed(), instrument.magnitude());
}

template<class I>
void print_instrument(std::ostream& os, const I& instrument) {
  os << instrument_line(instrument) << '\n';
}

// Type-erased overload: every read is dispatched at runtime
inline void print_instrument(std::ostream& os, const AnyInstrument& instrument) {
  os << format_line(instrument.type_name(), instrument.is_pulsed(), instrument.magnitude()) << '\n';
}

/**
 * @brief JSON object {"type", "pulsed", "magnitude"}
 */
template<class I>
json instrument_to_json(const I& instrument) {
  static_assert(is_instrument_v<I>, "instrument_to_json requires an Instrument");
  return json{{"type", instrument_label(instrument)},
              {"pulsed", static_cast<bool>(instrument.is_pulsed())},
              {"magnitude", static_cast<double>(instrument.magnitude())}};
}

// Found by ADL, lets `json j = fleet;` convert a whole Fleet
inline void to_json(json& j, const AnyInstrument& instrument) {
  j = instrument_to_json(instrument);
}
