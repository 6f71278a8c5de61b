#pragma once
#include "../hw/instrument.hpp"
#include <memory>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <utility>

/**
 * @brief Type-erased Instrument with value semantics
 *
 * Holds a value of any type satisfying the Instrument contract. The concrete
 * type is not part of AnyInstrument's type, so values of different
 * implementers can live in the same container. Every read is a virtual call
 * resolved at the point of use.
 *
 * The held value is immutable and shared between copies. Moves copy the
 * shared pointer, so a moved-from AnyInstrument still holds its value.
 */
class AnyInstrument {
public:
  template<class T,
           class = std::enable_if_t<std::conjunction_v<
               std::negation<std::is_same<std::decay_t<T>, AnyInstrument>>,
               is_instrument<std::decay_t<T>>>>>
  AnyInstrument(T&& instrument)
      : ptr_(std::make_shared<Model<std::decay_t<T>>>(std::forward<T>(instrument))) {}

  // No move operations: rvalues are copied and are never left empty
  AnyInstrument(const AnyInstrument&) = default;
  AnyInstrument& operator=(const AnyInstrument&) = default;

  bool is_pulsed() const { return ptr_->is_pulsed(); }
  double magnitude() const { return ptr_->magnitude(); }

  /**
   * @brief Name of the concrete type behind the wrapper
   */
  std::string type_name() const { return ptr_->type_name(); }

  /**
   * @brief Type of the held value
   */
  const std::type_info& target_type() const { return ptr_->target_type(); }

  /**
   * @brief Access the held value if it is a T
   * @return Pointer to the held value, or nullptr if it holds another type
   */
  template<class T>
  const T* target() const {
    static_assert(!std::is_reference_v<T>, "target<T> requires an object type");
    using Held = std::remove_cv_t<T>;
    if (target_type() != typeid(Held)) return nullptr;
    return &static_cast<const Model<Held>&>(*ptr_).value;
  }

private:
  struct Concept {
    virtual ~Concept() = default;
    virtual bool is_pulsed() const = 0;
    virtual double magnitude() const = 0;
    virtual std::string type_name() const = 0;
    virtual const std::type_info& target_type() const = 0;
  };

  template<class T>
  struct Model final : Concept {
    T value;

    explicit Model(T v) : value(std::move(v)) {}

    bool is_pulsed() const override { return static_cast<bool>(value.is_pulsed()); }
    double magnitude() const override { return static_cast<double>(value.magnitude()); }

    std::string type_name() const override {
      if constexpr (has_type_name_v<T>) {
        return value.type_name();
      } else {
        return "some Instrument";
      }
    }

    const std::type_info& target_type() const override { return typeid(T); }
  };

  std::shared_ptr<const Concept> ptr_;
};
