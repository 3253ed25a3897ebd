#include "crypto/verifier.hpp"
#include "crypto/hasher.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"

#include <openssl/evp.h>
#include <openssl/rsa.h>
#include <memory>

namespace {

struct EVP_MD_CTX_Deleter { void operator()(EVP_MD_CTX* c) { EVP_MD_CTX_free(c); } };
using VerifyContext = std::unique_ptr<EVP_MD_CTX, EVP_MD_CTX_Deleter>;

// Logs why a check was rejected and leaves the OpenSSL error queue empty.
bool reject(const char* reason) {
    std::string detail = openssl_error_string();
    if (detail.empty()) {
        LOG_DEBUG("Signature rejected: ", reason);
    } else {
        LOG_DEBUG("Signature rejected: ", reason, " (", detail, ")");
    }
    return false;
}

// Null when the key or signature shape rules out a valid result.
VerifyContext begin_verify(const Signature& signature, const PublicKey& public_key, const char** reason) {
    if (public_key.empty() || !public_key.is_rsa()) {
        *reason = "no usable RSA public key";
        return nullptr;
    }
    if (signature.data.empty() ||
        signature.data.size() != static_cast<size_t>(EVP_PKEY_get_size(public_key.get()))) {
        *reason = "signature length does not match key modulus";
        return nullptr;
    }

    VerifyContext ctx(EVP_MD_CTX_new());
    if (!ctx) {
        *reason = "EVP_MD_CTX_new failed";
        return nullptr;
    }

    EVP_PKEY_CTX* pctx = nullptr;  // owned by ctx
    if (EVP_DigestVerifyInit(ctx.get(), &pctx, EVP_sha256(), NULL, public_key.get()) <= 0 ||
        EVP_PKEY_CTX_set_rsa_padding(pctx, RSA_PKCS1_PADDING) <= 0) {
        *reason = "verification setup failed";
        return nullptr;
    }
    return ctx;
}

bool finish(EVP_MD_CTX* ctx, const Signature& signature) {
    if (EVP_DigestVerifyFinal(ctx, signature.data.data(), signature.data.size()) != 1) {
        return reject("digest mismatch");
    }
    return true;
}

} // namespace

bool Verifier::verify(const std::vector<uint8_t>& document, const Signature& signature, const PublicKey& public_key) {
    const char* reason = "";
    VerifyContext ctx = begin_verify(signature, public_key, &reason);
    if (!ctx) {
        return reject(reason);
    }

    if (EVP_DigestVerifyUpdate(ctx.get(), document.data(), document.size()) <= 0) {
        return reject("digest update failed");
    }
    return finish(ctx.get(), signature);
}

bool Verifier::verify(const std::vector<uint8_t>& document, const std::string& signature_base64, const PublicKey& public_key) {
    std::optional<Signature> signature = Signature::from_base64(signature_base64);
    if (!signature) {
        return reject("signature is not valid base64");
    }
    return verify(document, *signature, public_key);
}

bool Verifier::verify(std::istream& document, const Signature& signature, const PublicKey& public_key) {
    const char* reason = "";
    VerifyContext ctx = begin_verify(signature, public_key, &reason);
    if (!ctx) {
        return reject(reason);
    }

    std::vector<char> buffer(Hasher::STREAM_CHUNK_SIZE);
    while (document) {
        document.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize n = document.gcount();
        if (n > 0 && EVP_DigestVerifyUpdate(ctx.get(), buffer.data(), static_cast<size_t>(n)) <= 0) {
            return reject("digest update failed");
        }
    }
    if (document.bad()) {
        return reject("read error on document stream");
    }
    return finish(ctx.get(), signature);
}
