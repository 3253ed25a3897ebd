#include "crypto/keys.hpp"
#include "crypto/hasher.hpp"
#include "common/base64.hpp"
#include "common/errors.hpp"

#include <openssl/x509.h>
#include <openssl/crypto.h>
#include <stdexcept>
#include <utility>

namespace {

struct EVP_PKEY_Deleter { void operator()(EVP_PKEY* p) { EVP_PKEY_free(p); } };

// SubjectPublicKeyInfo DER of any key handle (private keys include their public half).
std::vector<uint8_t> spki_der(EVP_PKEY* pkey) {
    unsigned char* buf = nullptr;
    int len = i2d_PUBKEY(pkey, &buf);
    if (len <= 0) {
        throw std::runtime_error("i2d_PUBKEY failed: " + openssl_error_string());
    }
    std::vector<uint8_t> der(buf, buf + len);
    OPENSSL_free(buf);
    return der;
}

} // namespace

KeyHandle::KeyHandle(EVP_PKEY* pkey) : pkey_(pkey, EVP_PKEY_Deleter()) {}

int KeyHandle::modulus_bits() const {
    return pkey_ ? EVP_PKEY_get_bits(pkey_.get()) : 0;
}

bool KeyHandle::is_rsa() const {
    return pkey_ && EVP_PKEY_is_a(pkey_.get(), "RSA");
}

bool KeyHandle::same_key(const KeyHandle& other) const {
    if (!pkey_ || !other.pkey_) {
        return !pkey_ && !other.pkey_;
    }
    if (pkey_ == other.pkey_) return true;
    return EVP_PKEY_eq(pkey_.get(), other.pkey_.get()) == 1;
}

PublicKey PrivateKey::public_key() const {
    if (empty()) {
        throw std::invalid_argument("Cannot derive a public key from an empty private key");
    }
    std::vector<uint8_t> der = spki_der(get());
    const unsigned char* p = der.data();
    EVP_PKEY* pub = d2i_PUBKEY(nullptr, &p, static_cast<long>(der.size()));
    if (!pub) {
        throw std::runtime_error("d2i_PUBKEY failed: " + openssl_error_string());
    }
    return PublicKey(pub);
}

std::string PublicKey::fingerprint() const {
    if (empty()) return {};
    return Hasher::hash_to_hex(Hasher::sha256(spki_der(get())));
}

std::string Signature::to_base64() const {
    return Base64::encode(data);
}

std::optional<Signature> Signature::from_base64(const std::string& text) {
    auto bytes = Base64::decode(text);
    if (!bytes) return std::nullopt;
    return Signature{std::move(*bytes)};
}
