#include "common/config.hpp"
#include <stdexcept>
#include <sstream>

int parse_key_bits(const std::string& value) {
    size_t pos = 0;
    int bits = 0;
    try {
        bits = std::stoi(value, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid key size: " + value);
    }
    if (pos != value.size() || bits <= 0) {
        throw std::invalid_argument("Invalid key size: " + value);
    }
    return bits;
}

AppConfig parse_args(int argc, char* argv[]) {
    std::vector<std::string> tokens;
    for (int i = 1; i < argc; ++i) {
        tokens.emplace_back(argv[i]);
    }
    return parse_args(tokens);
}

AppConfig parse_args(const std::vector<std::string>& argv) {
    AppConfig config;
    bool mode_set = false;

    for (size_t i = 0; i < argv.size(); ++i) {
        const std::string& tok = argv[i];

        auto next_value = [&](const std::string& option) -> const std::string& {
            if (i + 1 >= argv.size()) {
                throw std::invalid_argument("Option " + option + " requires a value");
            }
            return argv[++i];
        };

        if (tok == "--log-file") {
            config.log_file = next_value(tok);
        } else if (tok == "--bits") {
            config.key_bits = parse_key_bits(next_value(tok));
        } else if (tok == "--verbose" || tok == "-v") {
            config.verbose = true;
        } else if (tok == "--help" || tok == "-h") {
            config.mode = "help";
            mode_set = true;
        } else if (tok.size() > 1 && tok[0] == '-') {
            throw std::invalid_argument("Unknown option: " + tok);
        } else if (!mode_set) {
            config.mode = tok;
            mode_set = true;
        } else {
            config.args.push_back(tok);
        }
    }
    return config;
}

std::string usage() {
    std::ostringstream ss;
    ss << "Usage: docsign <mode> [args] [options]\n"
       << "Modes:\n"
       << "  interactive                                - Interactive signing session (default)\n"
       << "  keygen <out_dir>                           - Write private_key.pem and public_key.pem\n"
       << "  sign <private.pem> <file> [sig_path]       - Sign a file, writes <file>.sig by default\n"
       << "  verify <public.pem> <file> <sig_path>      - Verify a signature (exit 0 valid, 2 invalid)\n"
       << "Options:\n"
       << "  --bits <n>          RSA modulus size for keygen (default 2048)\n"
       << "  --log-file <path>   Log file (default docsign.log, empty to disable)\n"
       << "  --verbose, -v       Debug logging\n"
       << "  --help, -h          Show this help\n";
    return ss.str();
}
