#pragma once
#include "../hw/instrument.hpp"
#include "../hw/beam_counter.hpp"
#include "../hw/magnet.hpp"
#include <utility>

/**
 * @brief Instrument whose concrete type is fixed at compile time
 *
 * The implementer is a template parameter, so every call is resolved
 * statically and can be inlined. Only the capability set is exposed:
 * implementer-specific members (units(), type_name()) are not reachable
 * through the wrapper.
 */
template<class I>
class OpaqueInstrument {
  static_assert(is_instrument_v<I>, "OpaqueInstrument requires an Instrument");

public:
  explicit OpaqueInstrument(I inner) : inner_(std::move(inner)) {}

  bool is_pulsed() const { return inner_.is_pulsed(); }
  double magnitude() const { return inner_.magnitude(); }

private:
  I inner_;
};

template<class I>
OpaqueInstrument<I> make_opaque(I inner) {
  return OpaqueInstrument<I>(std::move(inner));
}

/**
 * @brief The default instrument
 *
 * Return type is deduced and not spelled out. It is the same concrete type
 * on every call.
 */
inline auto default_instrument() {
  return make_opaque(BeamCounter{});
}

inline auto paired_instrument() {
  return make_opaque(Magnet{});
}

template<class I>
constexpr double read_magnitude(const I& instrument) {
  static_assert(is_instrument_v<I>, "read_magnitude requires an Instrument");
  return instrument.magnitude();
}

template<class I>
constexpr bool read_pulsed(const I& instrument) {
  static_assert(is_instrument_v<I>, "read_pulsed requires an Instrument");
  return instrument.is_pulsed();
}
