#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace beacon::core::security {

/**
 * @brief SHA-256 of @p data as 64 lowercase hex characters.
 * @throws std::runtime_error if the OpenSSL digest context cannot be used.
 */
std::string sha256_hex(std::string_view data);

/**
 * @brief First @p length hex characters of sha256_hex(data).
 */
std::string sha256_prefix(std::string_view data, std::size_t length);

}  // namespace beacon::core::security
