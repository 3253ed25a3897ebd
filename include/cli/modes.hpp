#ifndef DOCSIGN_MODES_HPP
#define DOCSIGN_MODES_HPP

#include <iostream>

#include "../common/config.hpp"

/**
 * @brief Runs the mode selected on the command line.
 *
 * interactive starts a CLI session on in/out. keygen, sign and verify are
 * one-shot file operations. Errors are logged, reported on err, and turned
 * into exit status 1. An invalid signature gives EXIT_INVALID_SIGNATURE.
 *
 * @return the process exit status.
 */
int run_mode(const AppConfig& config, std::istream& in = std::cin, std::ostream& out = std::cout,
             std::ostream& err = std::cerr);

constexpr int EXIT_INVALID_SIGNATURE = 2;

#endif // DOCSIGN_MODES_HPP
