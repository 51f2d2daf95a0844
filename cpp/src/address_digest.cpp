#include "ddosflowgen/address_digest.hpp"
#include <openssl/evp.h>
#include <stdexcept>

namespace ddosflowgen {

Digest digest(const std::string& text) {
    Digest out{};
    unsigned int out_len = 0;

    if (EVP_Digest(text.data(), text.size(), out.data(), &out_len,
                   EVP_md5(), nullptr) != 1 || out_len != DIGEST_LENGTH) {
        throw std::runtime_error("MD5 digest failed for: " + text);
    }
    return out;
}

std::string host_in_prefix(const std::string& prefix, const Digest& d) {
    return prefix + "." + std::to_string(d[0]) + "." + std::to_string(d[1]);
}

} // namespace ddosflowgen
