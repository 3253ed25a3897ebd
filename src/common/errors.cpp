#include "common/errors.hpp"
#include <openssl/err.h>

std::string openssl_error_string() {
    std::string result;
    unsigned long code;
    char buf[256];
    while ((code = ERR_get_error()) != 0) {
        ERR_error_string_n(code, buf, sizeof(buf));
        if (!result.empty()) result += "; ";
        result += buf;
    }
    return result;
}
