#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace soundscribe::util {

/*
  Download token helpers

  Tokens carry 256 bits from the OpenSSL CSPRNG, encoded as unpadded
  base64url so they can sit in a URL path segment as-is.
*/

inline constexpr std::size_t kTokenBytes = 32;

using TokenBytes = std::array<uint8_t, kTokenBytes>;

TokenBytes GenerateTokenBytes();

std::string GenerateToken();

std::string Base64UrlEncode(const uint8_t* data, std::size_t size);

// True when every character is in the base64url alphabet.
bool IsWellFormedToken(const std::string& token);

} // namespace soundscribe::util
