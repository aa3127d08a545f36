#include "ollama/utils/base64.hpp"

#include <string_view>

namespace ollama::utils {
namespace {

constexpr std::string_view kAlphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

}  // namespace

std::string encode_base64(const std::vector<std::uint8_t>& input) {
  std::string output;
  output.reserve(((input.size() + 2) / 3) * 4);

  std::size_t i = 0;
  for (; i + 3 <= input.size(); i += 3) {
    std::uint32_t triple = (static_cast<std::uint32_t>(input[i]) << 16) |
                           (static_cast<std::uint32_t>(input[i + 1]) << 8) |
                           static_cast<std::uint32_t>(input[i + 2]);
    output.push_back(kAlphabet[(triple >> 18) & 0x3F]);
    output.push_back(kAlphabet[(triple >> 12) & 0x3F]);
    output.push_back(kAlphabet[(triple >> 6) & 0x3F]);
    output.push_back(kAlphabet[triple & 0x3F]);
  }

  const std::size_t remaining = input.size() - i;
  if (remaining == 1) {
    std::uint32_t triple = static_cast<std::uint32_t>(input[i]) << 16;
    output.push_back(kAlphabet[(triple >> 18) & 0x3F]);
    output.push_back(kAlphabet[(triple >> 12) & 0x3F]);
    output.append("==");
  } else if (remaining == 2) {
    std::uint32_t triple = (static_cast<std::uint32_t>(input[i]) << 16) |
                           (static_cast<std::uint32_t>(input[i + 1]) << 8);
    output.push_back(kAlphabet[(triple >> 18) & 0x3F]);
    output.push_back(kAlphabet[(triple >> 12) & 0x3F]);
    output.push_back(kAlphabet[(triple >> 6) & 0x3F]);
    output.push_back('=');
  }

  return output;
}

}  // namespace ollama::utils
