#include <iostream>
#include <exception>
#include <string>

#include "config/config.hpp"
#include "app/walkthrough.hpp"

int main(int argc, char** argv) {
    if (argc > 2) {
        std::cerr << "Usage: " << argv[0] << " [config.json]" << std::endl;
        return 2;
    }

    try {
        DemoConfig cfg;
        if (argc == 2) {
            cfg = DemoConfig::from_file(argv[1]);
        }

        if (cfg.format == "json") {
            std::cout << run_json(cfg).dump(2) << std::endl;
            return 0;
        }

        std::cout << "Dispatch Lab - existential vs opaque instruments" << std::endl;
        std::cout << "Configuration: " << cfg.to_json().dump() << std::endl;
        std::cout << std::endl;

        run_text(std::cout, cfg);
        std::cout.flush();

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
