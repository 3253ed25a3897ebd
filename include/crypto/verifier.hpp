#ifndef DOCSIGN_VERIFIER_HPP
#define DOCSIGN_VERIFIER_HPP

#include "keys.hpp"
#include <vector>
#include <string>
#include <istream>
#include <cstdint>

// Checks RSASSA-PKCS#1 v1.5 / SHA-256 signatures.
//
// Every overload fails closed: malformed base64, wrong length, empty or
// non-RSA keys, stream errors and digest mismatches all return false.
// Only allocation failure propagates.
class Verifier {
public:
    static bool verify(const std::vector<uint8_t>& document, const Signature& signature, const PublicKey& public_key);

    // Signature given as base64 text; surrounding whitespace is ignored.
    static bool verify(const std::vector<uint8_t>& document, const std::string& signature_base64, const PublicKey& public_key);

    // Digests the stream incrementally until EOF.
    static bool verify(std::istream& document, const Signature& signature, const PublicKey& public_key);
};

#endif // DOCSIGN_VERIFIER_HPP
