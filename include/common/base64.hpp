#ifndef DOCSIGN_BASE64_HPP
#define DOCSIGN_BASE64_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <optional>

namespace Base64 {

/**
 * @brief Encodes bytes as standard padded base64 on a single line.
 */
std::string encode(const std::vector<uint8_t>& data);

/**
 * @brief Decodes standard padded base64.
 *
 * Surrounding whitespace is ignored. Embedded whitespace, characters outside
 * the alphabet, a length that is not a multiple of four, or misplaced padding
 * all yield std::nullopt.
 */
std::optional<std::vector<uint8_t>> decode(const std::string& text);

} // namespace Base64

#endif // DOCSIGN_BASE64_HPP
