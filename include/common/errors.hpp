#ifndef DOCSIGN_ERRORS_HPP
#define DOCSIGN_ERRORS_HPP

#include <stdexcept>
#include <string>

/**
 * @brief Base class for all errors raised by the signing core.
 */
class DocSignError : public std::runtime_error {
public:
    explicit DocSignError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Key creation failed (entropy source or algorithm). Not retried.
 */
class KeyGenerationError : public DocSignError {
public:
    explicit KeyGenerationError(const std::string& message) : DocSignError(message) {}
};

/**
 * @brief The supplied bytes are not a usable RSA key encoding.
 */
class KeyParseError : public DocSignError {
public:
    explicit KeyParseError(const std::string& message) : DocSignError(message) {}
};

/**
 * @brief Signing failed: unusable private key or unreadable document.
 */
class SigningError : public DocSignError {
public:
    explicit SigningError(const std::string& message) : DocSignError(message) {}
};

// Drains the OpenSSL error queue into a single line, empty if nothing queued.
std::string openssl_error_string();

#endif // DOCSIGN_ERRORS_HPP
