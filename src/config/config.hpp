#pragma once
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>
using json = nlohmann::json;

/**
 * @brief Configuration of the dispatch_demo program
 *
 * Read from a JSON object. Every field is optional:
 * {"seed": 42, "fleet_size": 4, "format": "text", "repeat": 3}
 *
 * Unknown keys are ignored. Malformed input or invalid values throw
 * std::runtime_error naming the offending field.
 */
struct DemoConfig {
  std::uint64_t seed{0};         ///< Random fleet seed (0 = random device)
  std::size_t fleet_size{4};     ///< Random fleet length, 1..1000
  std::string format{"text"};    ///< "text" or "json"
  int repeat{3};                 ///< Opaque call repeats, 1..100

  static constexpr std::size_t kMaxFleetSize = 1000;
  static constexpr int kMaxRepeat = 100;

  /**
   * @brief Parse configuration from JSON text
   * @throws std::runtime_error on malformed JSON or invalid fields
   */
  static DemoConfig from_json_string(const std::string& s) {
    auto j = json::parse(s, nullptr, false);
    if (j.is_discarded()) throw std::runtime_error("config: malformed JSON");
    if (!j.is_object()) throw std::runtime_error("config: expected a JSON object");

    DemoConfig cfg;
    if (j.contains("seed")) {
      if (!j["seed"].is_number_unsigned())
        throw std::runtime_error("config: 'seed' must be a non-negative integer");
      cfg.seed = j["seed"].get<std::uint64_t>();
    }
    if (j.contains("fleet_size")) {
      auto v = integer_field(j, "fleet_size");
      if (v < 1 || v > static_cast<long long>(kMaxFleetSize))
        throw std::runtime_error("config: 'fleet_size' must be in 1.." + std::to_string(kMaxFleetSize));
      cfg.fleet_size = static_cast<std::size_t>(v);
    }
    if (j.contains("format")) {
      if (!j["format"].is_string())
        throw std::runtime_error("config: 'format' must be a string");
      cfg.format = j["format"].get<std::string>();
      if (cfg.format != "text" && cfg.format != "json")
        throw std::runtime_error("config: 'format' must be \"text\" or \"json\"");
    }
    if (j.contains("repeat")) {
      auto v = integer_field(j, "repeat");
      if (v < 1 || v > kMaxRepeat)
        throw std::runtime_error("config: 'repeat' must be in 1.." + std::to_string(kMaxRepeat));
      cfg.repeat = static_cast<int>(v);
    }
    return cfg;
  }

  /**
   * @brief Load configuration from a JSON file
   * @throws std::runtime_error if the file cannot be read or is invalid
   */
  static DemoConfig from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("config: cannot open " + path);
    std::stringstream buf;
    buf << in.rdbuf();
    return from_json_string(buf.str());
  }

  json to_json() const {
    return json{{"seed", seed}, {"fleet_size", fleet_size}, {"format", format}, {"repeat", repeat}};
  }

private:
  static long long integer_field(const json& j, const char* name) {
    const auto& v = j[name];
    if (!v.is_number_integer())
      throw std::runtime_error(std::string("config: '") + name + "' must be an integer");
    if (v.is_number_unsigned() && v.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<long long>::max()))
      throw std::runtime_error(std::string("config: '") + name + "' is out of range");
    return v.get<long long>();
  }
};
