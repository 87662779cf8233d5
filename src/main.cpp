// main.cpp

#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>

#include "config.hpp"
#include "logger.hpp"
#include "monitor.hpp"
#include "utils.hpp"

int main(int argc, char** argv) {
    std::string config_path = argc > 1 ? argv[1] : CONFIG_FILE;

    try {
        // 1. Load config; any problem here stops the process
        Config config;
        std::string error;
        if (!load_config(config_path, config, error)) {
            throw std::runtime_error("Failed to load configuration: " + error);
        }

        if (!create_dir(config.bot.log_path)) {
            throw std::runtime_error("Failed to create logs directory: " + config.bot.log_path);
        }
        set_log_dir(config.bot.log_path);
        set_debug_logging(config.bot.debug);
        log_status("Loaded config from " + config_path);

        // 2. Build the engine with the real camera, encoder, light and messaging
        Monitor monitor(config, make_default_collaborators(config));

        // 3. Telemetry and commands arrive on stdin
        monitor.run(std::cin);

    } catch (const std::runtime_error& e) {
        std::cerr << "Fatal Error during setup: " << e.what() << std::endl;
        std::cerr << "Action Required: Check " << config_path << " and directory permissions." << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Unhandled Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
