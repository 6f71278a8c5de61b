#pragma once
#include <string>
#include <type_traits>
#include <utility>

/**
 * @brief Capability contract shared by every instrument
 *
 * An instrument is any type with two const, read-only attributes:
 * - is_pulsed(): boolean flag, convertible to bool
 * - magnitude(): floating-point reading, convertible to double
 *
 * There is no base class. Conformance is structural and checked at compile
 * time with is_instrument_v, so the same types can be used behind the
 * type-erased AnyInstrument or directly through templates.
 */
template<class T, class = void>
struct is_instrument : std::false_type {};

template<class T>
struct is_instrument<T, std::void_t<decltype(std::declval<const T&>().is_pulsed()),
                                    decltype(std::declval<const T&>().magnitude())>>
    : std::bool_constant<
          std::is_convertible_v<decltype(std::declval<const T&>().is_pulsed()), bool> &&
          std::is_convertible_v<decltype(std::declval<const T&>().magnitude()), double>> {};

template<class T>
inline constexpr bool is_instrument_v = is_instrument<T>::value;

/**
 * @brief Detects an optional type_name() member (static or not)
 */
template<class T, class = void>
struct has_type_name : std::false_type {};

template<class T>
struct has_type_name<T, std::void_t<decltype(std::declval<const T&>().type_name())>>
    : std::is_convertible<decltype(std::declval<const T&>().type_name()), std::string> {};

template<class T>
inline constexpr bool has_type_name_v = has_type_name<T>::value;

/**
 * @brief Display label for an instrument
 * @return type_name() when the type publishes one, "some Instrument" otherwise
 */
template<class T>
std::string instrument_label(const T& instrument) {
  static_assert(is_instrument_v<T>, "instrument_label requires an Instrument");
  if constexpr (has_type_name_v<T>) {
    return instrument.type_name();
  } else {
    (void)instrument;
    return "some Instrument";
  }
}
