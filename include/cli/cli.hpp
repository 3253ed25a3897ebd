#ifndef DOCSIGN_CLI_HPP
#define DOCSIGN_CLI_HPP

#include <string>
#include <vector>
#include <iostream>

#include "../crypto/keys.hpp"

// Interactive signing session. Holds the current key pair between commands;
// a failed command leaves it unchanged.
class CLI {
public:
    explicit CLI(std::istream& in = std::cin, std::ostream& out = std::cout);
    ~CLI();

    void run();
    void handle_command(const std::string& line);

    bool running() const { return running_; }
    const PrivateKey& private_key() const { return private_key_; }
    const PublicKey& public_key() const { return public_key_; }

private:
    void print_help();

    void cmd_keygen(const std::vector<std::string>& args);
    void cmd_export_private(const std::vector<std::string>& args);
    void cmd_export_public(const std::vector<std::string>& args);
    void cmd_import_private(const std::vector<std::string>& args);
    void cmd_import_public(const std::vector<std::string>& args);
    void cmd_sign(const std::vector<std::string>& args);
    void cmd_verify(const std::vector<std::string>& args);
    void cmd_status(const std::vector<std::string>& args);

    // Writes key text to path, or into path/default_name when path is a directory.
    void save_key(const std::string& path, const std::string& default_name, const std::vector<uint8_t>& pem,
                  bool owner_only);

    std::istream& in_;
    std::ostream& out_;
    bool running_;

    PrivateKey private_key_;
    PublicKey public_key_;
};

#endif // DOCSIGN_CLI_HPP
