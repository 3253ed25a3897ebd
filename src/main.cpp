#include <iostream>
#include <string>

#include "cli/modes.hpp"
#include "common/config.hpp"
#include "common/logger.hpp"

int main(int argc, char* argv[]) {
    AppConfig config;
    try {
        config = parse_args(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n" << usage();
        return 1;
    }

    if (config.mode == "help") {
        std::cout << usage();
        return 0;
    }

    // Initialize Logger
    Logger::instance().init(config.log_file);
    Logger::instance().set_level(config.verbose ? LogLevel::DEBUG : LogLevel::WARNING);
    LOG_INFO("Starting docsign in ", config.mode, " mode");

    return run_mode(config);
}
