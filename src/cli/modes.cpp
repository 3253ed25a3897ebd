#include "cli/modes.hpp"
#include "cli/cli.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "crypto/key_manager.hpp"
#include "crypto/signer.hpp"
#include "crypto/verifier.hpp"
#include "files/document_io.hpp"

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

namespace {

int run_keygen(const AppConfig& config, std::ostream& out, std::ostream& err) {
    if (config.args.size() != 1) {
        err << usage();
        return 1;
    }
    fs::path out_dir(config.args[0]);
    fs::create_directories(out_dir);

    KeyPair kp = KeyManager::generate(config.key_bits);
    DocumentIO::write_private_file(out_dir / "private_key.pem", KeyManager::export_private_key(kp.private_key));
    DocumentIO::write_file(out_dir / "public_key.pem", KeyManager::export_public_key(kp.public_key));

    out << "Wrote " << (out_dir / "private_key.pem").string() << " and "
        << (out_dir / "public_key.pem").string() << "\n"
        << "Fingerprint: " << kp.public_key.fingerprint() << std::endl;
    return 0;
}

int run_sign(const AppConfig& config, std::ostream& out, std::ostream& err) {
    if (config.args.size() < 2 || config.args.size() > 3) {
        err << usage();
        return 1;
    }
    PrivateKey key = KeyManager::import_private_key(DocumentIO::read_file(config.args[0]));
    fs::path doc(config.args[1]);

    Signature signature = Signer::sign(DocumentIO::read_file(doc), key);
    fs::path sig_path = config.args.size() == 3 ? fs::path(config.args[2]) : DocumentIO::signature_path_for(doc);
    DocumentIO::write_file(sig_path, signature.to_base64() + "\n");

    LOG_INFO("Signed ", doc.string(), ", signature written to ", sig_path.string());
    out << signature.to_base64() << std::endl;
    return 0;
}

int run_verify(const AppConfig& config, std::ostream& out, std::ostream& err) {
    if (config.args.size() != 3) {
        err << usage();
        return 1;
    }
    PublicKey key = KeyManager::import_public_key(DocumentIO::read_file(config.args[0]));
    std::vector<uint8_t> document = DocumentIO::read_file(config.args[1]);
    std::vector<uint8_t> sig_raw = DocumentIO::read_file(config.args[2]);

    if (Verifier::verify(document, std::string(sig_raw.begin(), sig_raw.end()), key)) {
        out << "VALID" << std::endl;
        return 0;
    }
    out << "INVALID" << std::endl;
    return EXIT_INVALID_SIGNATURE;
}

} // namespace

int run_mode(const AppConfig& config, std::istream& in, std::ostream& out, std::ostream& err) {
    try {
        if (config.mode == "interactive") {
            CLI cli(in, out);
            cli.run();
            return 0;
        } else if (config.mode == "keygen") {
            return run_keygen(config, out, err);
        } else if (config.mode == "sign") {
            return run_sign(config, out, err);
        } else if (config.mode == "verify") {
            return run_verify(config, out, err);
        }
        err << "Unknown mode: " << config.mode << "\n" << usage();
        return 1;
    } catch (const DocSignError& e) {
        LOG_ERR(config.mode, " failed: ", e.what());
        err << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        LOG_ERR(config.mode, " failed: ", e.what());
        err << "Fatal Error: " << e.what() << std::endl;
        return 1;
    }
}
