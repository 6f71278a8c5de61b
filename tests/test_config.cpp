#include "../src/config/config.hpp"
#include <cassert>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

// Returns true if parsing `text` throws std::runtime_error
static bool rejects(const std::string& text) {
    try {
        DemoConfig::from_json_string(text);
    } catch (const std::runtime_error& e) {
        std::cout << "  rejected: " << e.what() << std::endl;
        return true;
    }
    return false;
}

int main() {
    std::cout << "Testing DemoConfig..." << std::endl;

    // Test 1: defaults
    {
        std::cout << "Test 1: Defaults" << std::endl;
        DemoConfig cfg;
        assert(cfg.seed == 0);
        assert(cfg.fleet_size == 4);
        assert(cfg.format == "text");
        assert(cfg.repeat == 3);

        DemoConfig parsed = DemoConfig::from_json_string("{}");
        assert(parsed.seed == cfg.seed);
        assert(parsed.fleet_size == cfg.fleet_size);
        assert(parsed.format == cfg.format);
        assert(parsed.repeat == cfg.repeat);
    }

    // Test 2: overrides, unknown keys ignored
    {
        std::cout << "Test 2: Overrides" << std::endl;
        auto cfg = DemoConfig::from_json_string(
            R"({"seed": 42, "fleet_size": 10, "format": "json", "repeat": 5, "comment": "x"})");
        assert(cfg.seed == 42);
        assert(cfg.fleet_size == 10);
        assert(cfg.format == "json");
        assert(cfg.repeat == 5);

        json j = cfg.to_json();
        assert(j["seed"] == 42);
        assert(j["fleet_size"] == 10);
        assert(j["format"] == "json");
        assert(j["repeat"] == 5);
        assert(!j.contains("comment"));
    }

    // Test 3: malformed documents
    {
        std::cout << "Test 3: Malformed input" << std::endl;
        assert(rejects(""));
        assert(rejects("{"));
        assert(rejects("[1, 2]"));
        assert(rejects("\"text\""));
    }

    // Test 4: invalid field types and ranges
    {
        std::cout << "Test 4: Invalid fields" << std::endl;
        assert(rejects(R"({"seed": -1})"));
        assert(rejects(R"({"seed": 1.5})"));
        assert(rejects(R"({"fleet_size": 0})"));
        assert(rejects(R"({"fleet_size": 1001})"));
        assert(rejects(R"({"fleet_size": "4"})"));
        assert(rejects(R"({"format": "xml"})"));
        assert(rejects(R"({"format": 1})"));
        assert(rejects(R"({"repeat": 0})"));
        assert(rejects(R"({"repeat": 101})"));
        assert(rejects(R"({"repeat": 18446744073709551615})"));

        // Boundaries are accepted
        assert(!rejects(R"({"fleet_size": 1, "repeat": 1})"));
        assert(!rejects(R"({"fleet_size": 1000, "repeat": 100})"));
    }

    // Test 5: loading from a file
    {
        std::cout << "Test 5: File loading" << std::endl;
        const std::string path = "test_config_tmp.json";
        {
            std::ofstream out(path);
            out << R"({"seed": 7, "format": "text"})";
        }
        auto cfg = DemoConfig::from_file(path);
        assert(cfg.seed == 7);
        assert(cfg.format == "text");
        std::remove(path.c_str());

        bool threw = false;
        try {
            DemoConfig::from_file("does_not_exist.json");
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw);
    }

    std::cout << "✅ All DemoConfig tests passed!" << std::endl;
    return 0;
}
