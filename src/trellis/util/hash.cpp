/**
 * @file hash.cpp
 * @brief EVP one-shot digests and the name shortening scheme used for proxy objects.
 */
#include "trellis/util/hash.hpp"

#include <openssl/evp.h>

#include <exception>

#include "trellis/config/constants.hpp"
#include "trellis/obs/log.hpp"

namespace trellis::util {

namespace {

std::string digest_hex(std::string_view data, const EVP_MD* md) {
    unsigned char buf[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    // SHA-1 and SHA-256 are always available in libcrypto; a failure here means a broken installation.
    if (EVP_Digest(data.data(), data.size(), buf, &len, md, nullptr) != 1) {
        obs::logger()->critical("EVP_Digest({}) failed; libcrypto is unusable", EVP_MD_get0_name(md));
        std::terminate();
    }
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (unsigned int i = 0; i < len; ++i) {
        out.push_back(kHex[buf[i] >> 4]);
        out.push_back(kHex[buf[i] & 0x0f]);
    }
    return out;
}

std::string join(const std::vector<std::string>& parts) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i) out.push_back('/');
        out += parts[i];
    }
    return out;
}

// Keep s within l characters, replacing its tail with suffix when it must be cut.
std::string truncate(std::size_t l, const std::string& s, const std::string& suffix) {
    if (l >= s.size()) return s;
    if (l > suffix.size()) return s.substr(0, l - suffix.size()) + suffix;
    return s.substr(0, l);
}

std::string short_hash(const std::string& s) {
    return sha256_hex(s).substr(0, config::constants::SHORT_HASH_LEN);
}

} // namespace

std::string sha1_hex(std::string_view data)   { return digest_hex(data, EVP_sha1()); }
std::string sha256_hex(std::string_view data) { return digest_hex(data, EVP_sha256()); }

std::string hashname(std::size_t limit, std::vector<std::string> parts) {
    std::string r = join(parts);
    if (limit > r.size() || parts.empty()) return r;

    const std::size_t each = limit / parts.size();
    for (std::size_t n = parts.size(); n-- > 0;) {
        parts[n] = truncate(each, parts[n], short_hash(parts[n]));
        r = join(parts);
        if (limit > r.size()) return r;
    }
    // Every part truncated and still too long.
    return truncate(limit - 1, r, short_hash(r));
}

} // namespace trellis::util
