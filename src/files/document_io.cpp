#include "files/document_io.hpp"
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>

namespace DocumentIO {

std::vector<uint8_t> read_file(const fs::path& path) {
    if (!fs::exists(path) || !fs::is_regular_file(path)) {
        throw std::runtime_error("File does not exist or is not a regular file: " + path.string());
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + path.string());
    }

    std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw std::runtime_error("Failed to read file: " + path.string());
    }
    return data;
}

namespace {

std::ofstream open_for_writing(const fs::path& path) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + path.string());
    }
    return file;
}

void write_bytes(std::ofstream& file, const fs::path& path, const std::vector<uint8_t>& data) {
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!file) {
        throw std::runtime_error("Write error on file: " + path.string());
    }
}

} // namespace

void write_file(const fs::path& path, const std::vector<uint8_t>& data) {
    std::ofstream file = open_for_writing(path);
    write_bytes(file, path, data);
}

void write_file(const fs::path& path, const std::string& text) {
    write_file(path, std::vector<uint8_t>(text.begin(), text.end()));
}

void write_private_file(const fs::path& path, const std::vector<uint8_t>& data) {
    std::ofstream file = open_for_writing(path);

    // Restrict before any key material lands in the file.
    std::error_code ec;
    fs::permissions(path, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace, ec);
    if (ec) {
        throw std::runtime_error("Failed to restrict permissions on " + path.string() + ": " + ec.message());
    }
    write_bytes(file, path, data);
}

fs::path signature_path_for(const fs::path& document) {
    fs::path sig = document;
    sig += SIGNATURE_SUFFIX;
    return sig;
}

bool looks_like_path(const std::string& arg) {
    std::error_code ec;
    return !arg.empty() && fs::is_regular_file(arg, ec);
}

} // namespace DocumentIO
