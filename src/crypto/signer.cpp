#include "crypto/signer.hpp"
#include "crypto/hasher.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"

#include <openssl/evp.h>
#include <openssl/rsa.h>
#include <memory>

namespace {

struct EVP_MD_CTX_Deleter { void operator()(EVP_MD_CTX* c) { EVP_MD_CTX_free(c); } };
using SignContext = std::unique_ptr<EVP_MD_CTX, EVP_MD_CTX_Deleter>;

SignContext begin_sign(const PrivateKey& private_key) {
    if (private_key.empty()) {
        throw SigningError("No private key supplied");
    }
    if (!private_key.is_rsa()) {
        throw SigningError("Private key is not an RSA key");
    }

    SignContext ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw SigningError("EVP_MD_CTX_new failed");
    }

    EVP_PKEY_CTX* pctx = nullptr;  // owned by ctx
    if (EVP_DigestSignInit(ctx.get(), &pctx, EVP_sha256(), NULL, private_key.get()) <= 0 ||
        EVP_PKEY_CTX_set_rsa_padding(pctx, RSA_PKCS1_PADDING) <= 0) {
        throw SigningError("Error initializing signature: " + openssl_error_string());
    }
    return ctx;
}

void update(EVP_MD_CTX* ctx, const void* data, size_t len) {
    if (EVP_DigestSignUpdate(ctx, data, len) <= 0) {
        throw SigningError("Error digesting document: " + openssl_error_string());
    }
}

Signature finish(EVP_MD_CTX* ctx) {
    size_t sig_len = 0;
    if (EVP_DigestSignFinal(ctx, NULL, &sig_len) <= 0) {
        throw SigningError("Error sizing signature: " + openssl_error_string());
    }

    Signature signature;
    signature.data.resize(sig_len);
    if (EVP_DigestSignFinal(ctx, signature.data.data(), &sig_len) <= 0) {
        throw SigningError("Error producing signature: " + openssl_error_string());
    }
    signature.data.resize(sig_len);
    return signature;
}

} // namespace

Signature Signer::sign(const std::vector<uint8_t>& document, const PrivateKey& private_key) {
    SignContext ctx = begin_sign(private_key);
    update(ctx.get(), document.data(), document.size());
    Signature signature = finish(ctx.get());

    LOG_DEBUG("Signed ", document.size(), " bytes, signature is ", signature.data.size(), " bytes");
    return signature;
}

Signature Signer::sign(std::istream& document, const PrivateKey& private_key) {
    SignContext ctx = begin_sign(private_key);

    std::vector<char> buffer(Hasher::STREAM_CHUNK_SIZE);
    uint64_t total = 0;
    while (document) {
        document.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize n = document.gcount();
        if (n > 0) {
            update(ctx.get(), buffer.data(), static_cast<size_t>(n));
            total += static_cast<uint64_t>(n);
        }
    }
    if (document.bad()) {
        throw SigningError("Read error on document stream after " + std::to_string(total) + " bytes");
    }

    Signature signature = finish(ctx.get());
    LOG_DEBUG("Signed ", total, " streamed bytes, signature is ", signature.data.size(), " bytes");
    return signature;
}
