#ifndef DOCSIGN_KEY_MANAGER_HPP
#define DOCSIGN_KEY_MANAGER_HPP

#include "keys.hpp"
#include <vector>
#include <string>
#include <cstdint>

enum class KeyEncoding {
    Pem,
    Der
};

class KeyManager {
public:
    static constexpr int DEFAULT_MODULUS_BITS = 2048;
    static constexpr int MIN_MODULUS_BITS = 2048;

    /**
     * @brief Generates a new RSA key pair (public exponent 65537).
     * @param bits Modulus size in bits, at least MIN_MODULUS_BITS.
     * @throws KeyGenerationError if the size is too small or OpenSSL fails.
     */
    static KeyPair generate(int bits = DEFAULT_MODULUS_BITS);

    /**
     * @brief Parses an RSA private key.
     *
     * Accepts PEM (PKCS#1 "RSA PRIVATE KEY" or PKCS#8 "PRIVATE KEY") and the
     * equivalent DER. Encrypted keys are not supported.
     *
     * @throws KeyParseError on empty, malformed, public-only or non-RSA input.
     */
    static PrivateKey import_private_key(const std::vector<uint8_t>& encoded);
    static PrivateKey import_private_key(const std::string& encoded);

    /**
     * @brief Parses an RSA public key.
     *
     * Accepts PEM (SPKI "PUBLIC KEY" or PKCS#1 "RSA PUBLIC KEY") and DER.
     * Private key material is also accepted; only its public half is kept.
     *
     * @throws KeyParseError on empty, malformed or non-RSA input.
     */
    static PublicKey import_public_key(const std::vector<uint8_t>& encoded);
    static PublicKey import_public_key(const std::string& encoded);

    // PKCS#1 "RSA PRIVATE KEY" PEM (64-column lines) or PKCS#1 DER.
    static std::vector<uint8_t> export_private_key(const PrivateKey& key, KeyEncoding encoding = KeyEncoding::Pem);

    // SPKI "PUBLIC KEY" PEM or SPKI DER.
    static std::vector<uint8_t> export_public_key(const PublicKey& key, KeyEncoding encoding = KeyEncoding::Pem);
};

#endif // DOCSIGN_KEY_MANAGER_HPP
