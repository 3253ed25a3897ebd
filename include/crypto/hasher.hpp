#ifndef DOCSIGN_HASHER_HPP
#define DOCSIGN_HASHER_HPP

#include <vector>
#include <string>
#include <array>
#include <istream>
#include <cstdint>

// SHA-256 produces a 32-byte hash.
constexpr size_t HASH_SIZE = 32;
using hash_t = std::array<uint8_t, HASH_SIZE>;

namespace Hasher {

// Read size used when digesting streams.
constexpr size_t STREAM_CHUNK_SIZE = 64 * 1024;

/**
 * @brief Calculates the SHA-256 hash of a data buffer.
 * @param data The data to hash.
 * @return A 32-byte SHA-256 hash.
 */
hash_t sha256(const std::vector<uint8_t>& data);

    // Calculate SHA-256 hash of a string
    hash_t sha256(const std::string& data);

/**
 * @brief Calculates the SHA-256 hash of everything left in a stream.
 * @throws std::runtime_error if the stream goes bad while reading.
 */
hash_t sha256(std::istream& in);

    // Helpers
    hash_t hex_to_hash(const std::string& hex);
    std::string hash_to_hex(const hash_t& hash);

} // namespace Hasher

#endif // DOCSIGN_HASHER_HPP
