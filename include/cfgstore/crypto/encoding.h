#pragma once

#include <cfgstore/core/types.h>

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace cfgstore::crypto {

/// Standard base64 with padding
std::string base64Encode(std::span<const uint8_t> data);

/// Decode standard base64; InvalidData on malformed input
Result<std::vector<uint8_t>> base64Decode(std::string_view encoded);

/// RFC 4648 base32 with padding (alphabet A-Z2-7)
std::string base32Encode(std::span<const uint8_t> data);

/// Cryptographically secure random bytes (OpenSSL RAND_bytes)
Result<std::vector<uint8_t>> randomBytes(size_t count);

/**
 * @brief Generate a TOTP shared secret
 * @return 20 random bytes, base32 encoded (32 characters)
 */
Result<std::string> generateOtpSecret();

} // namespace cfgstore::crypto
