#ifndef DOCSIGN_DOCUMENT_IO_HPP
#define DOCSIGN_DOCUMENT_IO_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <filesystem>

namespace fs = std::filesystem;

// File plumbing for the front end. The signing core never touches the file system.
namespace DocumentIO {

// Suffix of detached signature files written next to a document.
constexpr const char* SIGNATURE_SUFFIX = ".sig";

/**
 * @brief Reads a whole file as raw bytes.
 * @throws std::runtime_error if the path is not a regular file or cannot be read.
 */
std::vector<uint8_t> read_file(const fs::path& path);

/**
 * @brief Writes bytes to a file, replacing any existing content.
 * @throws std::runtime_error if the file cannot be opened or written.
 */
void write_file(const fs::path& path, const std::vector<uint8_t>& data);
void write_file(const fs::path& path, const std::string& text);

// Like write_file, but the file is readable and writable by its owner only (0600).
void write_private_file(const fs::path& path, const std::vector<uint8_t>& data);

// "<document>.sig"
fs::path signature_path_for(const fs::path& document);

// True when the argument names an existing regular file.
bool looks_like_path(const std::string& arg);

} // namespace DocumentIO

#endif // DOCSIGN_DOCUMENT_IO_HPP
