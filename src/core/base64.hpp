#ifndef RUNTAPE_CORE_BASE64_HPP_
#define RUNTAPE_CORE_BASE64_HPP_

#include <cstdint>
#include <string>
#include <string_view>

namespace runtape::core {

inline constexpr std::string_view kBase64Alphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

// Standard padded base64. Captured output is arbitrary binary, so tool
// payloads carry it encoded.
inline std::string Base64Encode(std::string_view input) {
  std::string result;
  result.reserve(((input.size() + 2) / 3) * 4);

  std::size_t i = 0;
  while (i + 3 <= input.size()) {
    const std::uint32_t triple = (static_cast<std::uint32_t>(static_cast<unsigned char>(input[i])) << 16U) |
                                 (static_cast<std::uint32_t>(static_cast<unsigned char>(input[i + 1])) << 8U) |
                                 static_cast<std::uint32_t>(static_cast<unsigned char>(input[i + 2]));
    result += kBase64Alphabet[(triple >> 18U) & 0x3FU];
    result += kBase64Alphabet[(triple >> 12U) & 0x3FU];
    result += kBase64Alphabet[(triple >> 6U) & 0x3FU];
    result += kBase64Alphabet[triple & 0x3FU];
    i += 3;
  }

  const std::size_t remaining = input.size() - i;
  if (remaining == 1U) {
    const std::uint32_t triple = static_cast<std::uint32_t>(static_cast<unsigned char>(input[i])) << 16U;
    result += kBase64Alphabet[(triple >> 18U) & 0x3FU];
    result += kBase64Alphabet[(triple >> 12U) & 0x3FU];
    result += "==";
  } else if (remaining == 2U) {
    const std::uint32_t triple = (static_cast<std::uint32_t>(static_cast<unsigned char>(input[i])) << 16U) |
                                 (static_cast<std::uint32_t>(static_cast<unsigned char>(input[i + 1])) << 8U);
    result += kBase64Alphabet[(triple >> 18U) & 0x3FU];
    result += kBase64Alphabet[(triple >> 12U) & 0x3FU];
    result += kBase64Alphabet[(triple >> 6U) & 0x3FU];
    result += '=';
  }
  return result;
}

} // namespace runtape::core

#endif // RUNTAPE_CORE_BASE64_HPP_
