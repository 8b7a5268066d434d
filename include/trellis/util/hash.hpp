#pragma once
/**
 * @file hash.hpp
 * @brief Digest helpers (OpenSSL EVP) and length-bounded name generation.
 */

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace trellis::util {

/// Lower-case hex SHA-1 of @p data.
std::string sha1_hex(std::string_view data);

/// Lower-case hex SHA-256 of @p data.
std::string sha256_hex(std::string_view data);

/**
 * @brief Join @p parts with '/' and keep the result strictly shorter than @p limit.
 *
 * Parts are shortened right to left, each to limit/parts.size() characters with a
 * short SHA-256 suffix of its original value, until the joined name fits.
 * Names that already fit are returned unchanged.
 */
std::string hashname(std::size_t limit, std::vector<std::string> parts);

} // namespace trellis::util
