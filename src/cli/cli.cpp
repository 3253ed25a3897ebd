#include "cli/cli.hpp"
#include "crypto/key_manager.hpp"
#include "crypto/signer.hpp"
#include "crypto/verifier.hpp"
#include "files/document_io.hpp"
#include "common/config.hpp"
#include "common/logger.hpp"
#include <sstream>
#include <fstream>
#include <filesystem>

namespace fs = std::filesystem;

CLI::CLI(std::istream& in, std::ostream& out)
    : in_(in), out_(out), running_(false) {}

CLI::~CLI() {}

void CLI::run() {
    running_ = true;
    print_help();

    std::string line;
    while (running_ && std::getline(in_, line)) {
        if (line.empty()) continue;
        handle_command(line);
    }
    running_ = false;
}

void CLI::print_help() {
    out_ << "Available commands:\n"
         << "  keygen [bits]                  - Generate a new RSA key pair (default 2048 bits)\n"
         << "  export_private [path]          - Show the private key PEM, optionally save it\n"
         << "  export_public [path]           - Show the public key PEM, optionally save it\n"
         << "  import_private <path>          - Load a private key (also sets the public key)\n"
         << "  import_public <path>           - Load a public key for verification\n"
         << "  sign <file> [sig_path]         - Sign a file, writes <file>.sig by default\n"
         << "  verify <file> <sig_file|b64>   - Verify a file against a signature\n"
         << "  status                         - Show loaded keys\n"
         << "  help                           - Show this help\n"
         << "  quit / exit                    - Exit\n"
         << std::endl;
}

void CLI::handle_command(const std::string& line) {
    std::istringstream iss(line);
    std::string cmd;
    iss >> cmd;

    std::vector<std::string> args;
    std::string arg;
    while (iss >> arg) args.push_back(arg);

    try {
        if (cmd == "keygen") cmd_keygen(args);
        else if (cmd == "export_private") cmd_export_private(args);
        else if (cmd == "export_public") cmd_export_public(args);
        else if (cmd == "import_private") cmd_import_private(args);
        else if (cmd == "import_public") cmd_import_public(args);
        else if (cmd == "sign") cmd_sign(args);
        else if (cmd == "verify") cmd_verify(args);
        else if (cmd == "status") cmd_status(args);
        else if (cmd == "help") print_help();
        else if (cmd == "quit" || cmd == "exit") running_ = false;
        else out_ << "Unknown command: " << cmd << std::endl;
    } catch (const std::exception& e) {
        LOG_ERR(cmd, " failed: ", e.what());
        out_ << "Error: " << e.what() << std::endl;
    }
}

void CLI::cmd_keygen(const std::vector<std::string>& args) {
    int bits = KeyManager::DEFAULT_MODULUS_BITS;
    if (!args.empty()) {
        try {
            bits = parse_key_bits(args[0]);
        } catch (const std::invalid_argument&) {
            out_ << "Usage: keygen [bits]" << std::endl;
            return;
        }
    }

    KeyPair kp = KeyManager::generate(bits);
    private_key_ = kp.private_key;
    public_key_ = kp.public_key;
    out_ << "Key pair generated (" << bits << " bits)\n"
         << "Fingerprint: " << public_key_.fingerprint() << std::endl;
}

void CLI::save_key(const std::string& path, const std::string& default_name, const std::vector<uint8_t>& pem,
                   bool owner_only) {
    fs::path target(path);
    if (fs::is_directory(target)) {
        target /= default_name;
    }
    if (owner_only) {
        DocumentIO::write_private_file(target, pem);
    } else {
        DocumentIO::write_file(target, pem);
    }
    LOG_INFO("Wrote ", default_name, " to ", target.string());
    out_ << "Saved to " << target.string() << std::endl;
}

void CLI::cmd_export_private(const std::vector<std::string>& args) {
    if (private_key_.empty()) {
        out_ << "No private key generated yet." << std::endl;
        return;
    }
    std::vector<uint8_t> pem = KeyManager::export_private_key(private_key_);
    out_ << std::string(pem.begin(), pem.end());
    if (!args.empty()) {
        save_key(args[0], "private_key.pem", pem, true);
    }
}

void CLI::cmd_export_public(const std::vector<std::string>& args) {
    if (public_key_.empty()) {
        out_ << "No public key generated yet." << std::endl;
        return;
    }
    std::vector<uint8_t> pem = KeyManager::export_public_key(public_key_);
    out_ << std::string(pem.begin(), pem.end());
    if (!args.empty()) {
        save_key(args[0], "public_key.pem", pem, false);
    }
}

void CLI::cmd_import_private(const std::vector<std::string>& args) {
    if (args.empty()) {
        out_ << "Usage: import_private <path>" << std::endl;
        return;
    }
    PrivateKey key = KeyManager::import_private_key(DocumentIO::read_file(args[0]));
    PublicKey pub = key.public_key();

    private_key_ = key;
    public_key_ = pub;
    out_ << "Private key imported (" << key.modulus_bits() << " bits)\n"
         << "Fingerprint: " << pub.fingerprint() << std::endl;
}

void CLI::cmd_import_public(const std::vector<std::string>& args) {
    if (args.empty()) {
        out_ << "Usage: import_public <path>" << std::endl;
        return;
    }
    PublicKey key = KeyManager::import_public_key(DocumentIO::read_file(args[0]));

    public_key_ = key;
    out_ << "Public key imported (" << key.modulus_bits() << " bits)\n"
         << "Fingerprint: " << key.fingerprint() << std::endl;
}

void CLI::cmd_sign(const std::vector<std::string>& args) {
    if (args.empty()) {
        out_ << "Usage: sign <file> [sig_path]" << std::endl;
        return;
    }
    if (private_key_.empty()) {
        out_ << "No private key available. Generate or import a key pair first." << std::endl;
        return;
    }

    fs::path doc(args[0]);
    if (!fs::is_regular_file(doc)) {
        out_ << "File not found: " << doc.string() << std::endl;
        return;
    }
    std::ifstream file(doc, std::ios::binary);
    if (!file.is_open()) {
        out_ << "Failed to open file: " << doc.string() << std::endl;
        return;
    }

    Signature signature = Signer::sign(file, private_key_);
    std::string b64 = signature.to_base64();

    fs::path sig_path = args.size() > 1 ? fs::path(args[1]) : DocumentIO::signature_path_for(doc);
    DocumentIO::write_file(sig_path, b64 + "\n");

    LOG_INFO("Signed ", doc.string(), ", signature written to ", sig_path.string());
    out_ << "Document signed successfully!\n"
         << "Signature (base64): " << b64 << "\n"
         << "Saved to " << sig_path.string() << std::endl;
}

void CLI::cmd_verify(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        out_ << "Usage: verify <file> <sig_file|base64>" << std::endl;
        return;
    }
    if (public_key_.empty()) {
        out_ << "No public key available. Import or generate one first." << std::endl;
        return;
    }

    std::vector<uint8_t> document = DocumentIO::read_file(args[0]);

    std::string signature_text = args[1];
    if (DocumentIO::looks_like_path(signature_text)) {
        std::vector<uint8_t> raw = DocumentIO::read_file(signature_text);
        signature_text.assign(raw.begin(), raw.end());
    }

    if (Verifier::verify(document, signature_text, public_key_)) {
        LOG_INFO("Signature valid for ", args[0]);
        out_ << "Signature is VALID. Document authenticity confirmed." << std::endl;
    } else {
        LOG_WARN("Signature invalid for ", args[0]);
        out_ << "Signature is INVALID. Document may have been tampered with." << std::endl;
    }
}

void CLI::cmd_status(const std::vector<std::string>& args) {
    if (private_key_.empty()) {
        out_ << "Private key: not loaded" << std::endl;
    } else {
        out_ << "Private key: loaded (" << private_key_.modulus_bits() << " bits)" << std::endl;
    }

    if (public_key_.empty()) {
        out_ << "Public key:  not loaded" << std::endl;
    } else {
        out_ << "Public key:  loaded (" << public_key_.modulus_bits() << " bits), fingerprint "
             << public_key_.fingerprint() << std::endl;
    }
}
