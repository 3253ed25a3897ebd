#include "common/base64.hpp"
#include <openssl/evp.h>
#include <cctype>

namespace Base64 {

namespace {

bool is_alphabet(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '/';
}

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t first = s.find_first_not_of(ws);
    if (first == std::string::npos) return {};
    size_t last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

} // namespace

std::string encode(const std::vector<uint8_t>& data) {
    if (data.empty()) return {};

    std::string out(4 * ((data.size() + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  data.data(), static_cast<int>(data.size()));
    out.resize(static_cast<size_t>(written));
    return out;
}

std::optional<std::vector<uint8_t>> decode(const std::string& text) {
    std::string s = trim(text);
    if (s.empty()) return std::vector<uint8_t>{};
    if (s.size() % 4 != 0) return std::nullopt;

    // EVP_DecodeBlock is lenient about padding placement, so check it here.
    size_t padding = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '=') {
            if (i < s.size() - 2) return std::nullopt;
            ++padding;
        } else if (!is_alphabet(c) || padding > 0) {
            return std::nullopt;
        }
    }

    std::vector<uint8_t> out(3 * (s.size() / 4));
    int len = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(s.data()),
                              static_cast<int>(s.size()));
    if (len < 0) return std::nullopt;

    // The decoded length includes the zero bytes produced by padding.
    out.resize(static_cast<size_t>(len) - padding);
    return out;
}

} // namespace Base64
