#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace ollama::utils {

std::string encode_base64(const std::vector<std::uint8_t>& input);

}
