#ifndef DOCSIGN_SIGNER_HPP
#define DOCSIGN_SIGNER_HPP

#include "keys.hpp"
#include <vector>
#include <istream>
#include <cstdint>

class Signer {
public:
    /**
     * @brief Signs a document with RSASSA-PKCS#1 v1.5 over SHA-256.
     *
     * The result is deterministic: the same document and key always give the
     * same modulus-length signature.
     *
     * @param document The raw document bytes.
     * @param private_key An RSA private key.
     * @return The signature.
     * @throws SigningError if the key is empty or not RSA, or OpenSSL fails.
     */
    static Signature sign(const std::vector<uint8_t>& document, const PrivateKey& private_key);

    /**
     * @brief Same as above, digesting the stream incrementally until EOF.
     * @throws SigningError also when the stream fails while being read.
     */
    static Signature sign(std::istream& document, const PrivateKey& private_key);
};

#endif // DOCSIGN_SIGNER_HPP
