#ifndef DOCSIGN_CONFIG_HPP
#define DOCSIGN_CONFIG_HPP

#include <string>
#include <vector>

struct AppConfig {
    std::string mode = "interactive";
    std::vector<std::string> args;       // positional arguments after the mode
    std::string log_file = "docsign.log"; // empty disables the log file
    bool verbose = false;
    int key_bits = 2048;
};

/**
 * @brief Parses the command line.
 *
 * Recognized options (anywhere on the line): --log-file <path>, --bits <n>,
 * --verbose / -v, --help / -h. The first positional token is the mode.
 *
 * @throws std::invalid_argument on unknown options or bad option values.
 */
AppConfig parse_args(int argc, char* argv[]);
AppConfig parse_args(const std::vector<std::string>& argv);

// Strict positive integer for a modulus size; trailing characters are rejected.
// @throws std::invalid_argument
int parse_key_bits(const std::string& value);

std::string usage();

#endif // DOCSIGN_CONFIG_HPP
