#ifndef DOCSIGN_KEYS_HPP
#define DOCSIGN_KEYS_HPP

#include <openssl/evp.h>

#include <vector>
#include <string>
#include <memory>
#include <optional>
#include <cstdint>

class PublicKey;

/**
 * @brief Shared, immutable handle to an OpenSSL key object.
 *
 * Copies share the same EVP_PKEY, which is never modified after construction.
 * Equality compares key material, not handle identity.
 */
class KeyHandle {
public:
    bool empty() const { return !pkey_; }
    EVP_PKEY* get() const { return pkey_.get(); }

    // Modulus size in bits, 0 for an empty handle.
    int modulus_bits() const;
    bool is_rsa() const;

protected:
    KeyHandle() = default;
    explicit KeyHandle(EVP_PKEY* pkey);   // takes ownership

    bool same_key(const KeyHandle& other) const;

private:
    std::shared_ptr<EVP_PKEY> pkey_;
};

class PrivateKey : public KeyHandle {
public:
    PrivateKey() = default;
    explicit PrivateKey(EVP_PKEY* pkey) : KeyHandle(pkey) {}

    /**
     * @brief Derives the matching public key.
     * @throws std::invalid_argument if the handle is empty.
     * @throws std::runtime_error if OpenSSL cannot re-encode the key.
     */
    PublicKey public_key() const;

    bool operator==(const PrivateKey& other) const { return same_key(other); }
    bool operator!=(const PrivateKey& other) const { return !same_key(other); }
};

class PublicKey : public KeyHandle {
public:
    PublicKey() = default;
    explicit PublicKey(EVP_PKEY* pkey) : KeyHandle(pkey) {}

    // Hex SHA-256 of the SubjectPublicKeyInfo DER encoding.
    std::string fingerprint() const;

    bool operator==(const PublicKey& other) const { return same_key(other); }
    bool operator!=(const PublicKey& other) const { return !same_key(other); }
};

// A key pair consisting of a private key and its public half.
struct KeyPair {
    PrivateKey private_key;
    PublicKey public_key;
};

// A detached RSA signature, modulus-length bytes.
struct Signature {
    std::vector<uint8_t> data;

    // Single-line base64, suitable for a text field or a .sig file.
    std::string to_base64() const;

    // std::nullopt when the text is not valid base64.
    static std::optional<Signature> from_base64(const std::string& text);

    bool operator==(const Signature& other) const { return data == other.data; }
    bool operator!=(const Signature& other) const { return data != other.data; }
};

#endif // DOCSIGN_KEYS_HPP
