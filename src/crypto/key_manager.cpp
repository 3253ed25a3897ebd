#include "crypto/key_manager.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"

#include <openssl/evp.h>
#include <openssl/rsa.h>
#include <openssl/pem.h>
#include <openssl/x509.h>
#include <openssl/decoder.h>
#include <openssl/core_names.h>
#include <openssl/bn.h>
#include <openssl/err.h>
#include <openssl/crypto.h>
#include <memory>
#include <stdexcept>

// Helper deleters for unique_ptr
struct BIO_Deleter { void operator()(BIO* b) { BIO_free_all(b); } };
struct EVP_PKEY_CTX_Deleter { void operator()(EVP_PKEY_CTX* c) { EVP_PKEY_CTX_free(c); } };
struct OSSL_DECODER_CTX_Deleter { void operator()(OSSL_DECODER_CTX* c) { OSSL_DECODER_CTX_free(c); } };

namespace {

bool is_space(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

// Runs the OpenSSL decoders over PEM or DER input for the given selection.
// Returns nullptr when nothing could decode it. The encoding must make up the
// whole input apart from surrounding whitespace: a second PEM block or bytes
// after the DER structure throw KeyParseError.
EVP_PKEY* decode_key(const std::vector<uint8_t>& encoded, int selection) {
    const unsigned char* data = encoded.data();
    size_t len = encoded.size();
    while (len > 0 && is_space(*data)) {
        ++data;
        --len;
    }
    if (len == 0) {
        return nullptr;
    }

    EVP_PKEY* pkey = nullptr;
    std::unique_ptr<OSSL_DECODER_CTX, OSSL_DECODER_CTX_Deleter> dctx(
        OSSL_DECODER_CTX_new_for_pkey(&pkey, NULL, NULL, NULL, selection, NULL, NULL));
    if (!dctx) {
        return nullptr;
    }

    // Never fall back to an interactive passphrase prompt.
    static const unsigned char empty_pass[] = "";
    OSSL_DECODER_CTX_set_passphrase(dctx.get(), empty_pass, 0);

    if (OSSL_DECODER_from_data(dctx.get(), &data, &len) != 1) {
        EVP_PKEY_free(pkey);
        return nullptr;
    }

    // The PEM reader leaves everything after the END line unread.
    for (size_t i = 0; i < len; ++i) {
        if (!is_space(data[i])) {
            EVP_PKEY_free(pkey);
            throw KeyParseError("Unexpected data after the key encoding (" + std::to_string(len - i) + " bytes)");
        }
    }
    return pkey;
}

template <typename Key>
Key require_rsa(EVP_PKEY* pkey, const char* what) {
    Key key(pkey);
    if (!key.is_rsa()) {
        throw KeyParseError(std::string("Unsupported key type for ") + what + ", expected RSA");
    }
    return key;
}

// The decoders accept public-only material for a keypair selection, so check for d.
bool has_private_exponent(EVP_PKEY* pkey) {
    BIGNUM* d = nullptr;
    if (EVP_PKEY_get_bn_param(pkey, OSSL_PKEY_PARAM_RSA_D, &d) != 1) {
        ERR_clear_error();
        return false;
    }
    BN_clear_free(d);
    return true;
}

std::vector<uint8_t> bio_contents(BIO* bio) {
    char* data = nullptr;
    long len = BIO_get_mem_data(bio, &data);
    if (len <= 0) {
        return {};
    }
    return std::vector<uint8_t>(data, data + len);
}

std::vector<uint8_t> take_der(unsigned char* buf, int len) {
    std::vector<uint8_t> der(buf, buf + len);
    OPENSSL_free(buf);
    return der;
}

} // namespace

KeyPair KeyManager::generate(int bits) {
    if (bits < MIN_MODULUS_BITS) {
        throw KeyGenerationError("RSA modulus of " + std::to_string(bits) +
                                 " bits is below the minimum of " + std::to_string(MIN_MODULUS_BITS));
    }

    std::unique_ptr<EVP_PKEY_CTX, EVP_PKEY_CTX_Deleter> ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, NULL));

    if (!ctx || EVP_PKEY_keygen_init(ctx.get()) <= 0 ||
        EVP_PKEY_CTX_set_rsa_keygen_bits(ctx.get(), bits) <= 0) {
        throw KeyGenerationError("Error initializing RSA keygen: " + openssl_error_string());
    }

    EVP_PKEY* pkey_raw = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &pkey_raw) <= 0) {
        throw KeyGenerationError("Error generating RSA key: " + openssl_error_string());
    }

    KeyPair kp;
    kp.private_key = PrivateKey(pkey_raw);
    try {
        kp.public_key = kp.private_key.public_key();
    } catch (const std::runtime_error& e) {
        throw KeyGenerationError(std::string("Error extracting public key: ") + e.what());
    }

    LOG_INFO("Generated ", bits, "-bit RSA key pair, fingerprint ", kp.public_key.fingerprint());
    return kp;
}

PrivateKey KeyManager::import_private_key(const std::vector<uint8_t>& encoded) {
    if (encoded.empty()) {
        throw KeyParseError("Private key data is empty");
    }

    EVP_PKEY* pkey = decode_key(encoded, EVP_PKEY_KEYPAIR);
    if (!pkey) {
        std::string detail = openssl_error_string();
        LOG_DEBUG("Private key decode failed: ", detail);
        throw KeyParseError("Not a valid private key encoding" + (detail.empty() ? "" : ": " + detail));
    }

    PrivateKey key = require_rsa<PrivateKey>(pkey, "private key");
    if (!has_private_exponent(key.get())) {
        throw KeyParseError("Key data holds only a public key, expected a private key");
    }
    LOG_DEBUG("Imported ", key.modulus_bits(), "-bit RSA private key");
    return key;
}

PrivateKey KeyManager::import_private_key(const std::string& encoded) {
    return import_private_key(std::vector<uint8_t>(encoded.begin(), encoded.end()));
}

PublicKey KeyManager::import_public_key(const std::vector<uint8_t>& encoded) {
    if (encoded.empty()) {
        throw KeyParseError("Public key data is empty");
    }

    EVP_PKEY* pkey = decode_key(encoded, EVP_PKEY_PUBLIC_KEY);
    if (!pkey) {
        // Private key material also carries the public half.
        ERR_clear_error();
        pkey = decode_key(encoded, EVP_PKEY_KEYPAIR);
    }
    if (!pkey) {
        std::string detail = openssl_error_string();
        LOG_DEBUG("Public key decode failed: ", detail);
        throw KeyParseError("Not a valid public key encoding" + (detail.empty() ? "" : ": " + detail));
    }

    PrivateKey decoded = require_rsa<PrivateKey>(pkey, "public key");
    if (!has_private_exponent(decoded.get())) {
        EVP_PKEY_up_ref(decoded.get());
        PublicKey key(decoded.get());
        LOG_DEBUG("Imported RSA public key, fingerprint ", key.fingerprint());
        return key;
    }

    try {
        PublicKey key = decoded.public_key();
        LOG_DEBUG("Imported RSA public key from private key material, fingerprint ", key.fingerprint());
        return key;
    } catch (const std::runtime_error& e) {
        throw KeyParseError(std::string("Cannot extract public key: ") + e.what());
    }
}

PublicKey KeyManager::import_public_key(const std::string& encoded) {
    return import_public_key(std::vector<uint8_t>(encoded.begin(), encoded.end()));
}

std::vector<uint8_t> KeyManager::export_private_key(const PrivateKey& key, KeyEncoding encoding) {
    if (key.empty()) {
        throw std::invalid_argument("Cannot export an empty private key");
    }

    if (encoding == KeyEncoding::Der) {
        unsigned char* buf = nullptr;
        int len = i2d_PrivateKey(key.get(), &buf);
        if (len <= 0) {
            throw std::runtime_error("i2d_PrivateKey failed: " + openssl_error_string());
        }
        return take_der(buf, len);
    }

    std::unique_ptr<BIO, BIO_Deleter> bio(BIO_new(BIO_s_mem()));
    if (!bio || PEM_write_bio_PrivateKey_traditional(bio.get(), key.get(), NULL, NULL, 0, NULL, NULL) != 1) {
        throw std::runtime_error("PEM_write_bio_PrivateKey_traditional failed: " + openssl_error_string());
    }
    return bio_contents(bio.get());
}

std::vector<uint8_t> KeyManager::export_public_key(const PublicKey& key, KeyEncoding encoding) {
    if (key.empty()) {
        throw std::invalid_argument("Cannot export an empty public key");
    }

    if (encoding == KeyEncoding::Der) {
        unsigned char* buf = nullptr;
        int len = i2d_PUBKEY(key.get(), &buf);
        if (len <= 0) {
            throw std::runtime_error("i2d_PUBKEY failed: " + openssl_error_string());
        }
        return take_der(buf, len);
    }

    std::unique_ptr<BIO, BIO_Deleter> bio(BIO_new(BIO_s_mem()));
    if (!bio || PEM_write_bio_PUBKEY(bio.get(), key.get()) != 1) {
        throw std::runtime_error("PEM_write_bio_PUBKEY failed: " + openssl_error_string());
    }
    return bio_contents(bio.get());
}
