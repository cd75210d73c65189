#pragma once

#include <string>

namespace call_engine::utils {

std::string base64_encode(const std::string& data);
// Returns an empty string for malformed input.
std::string base64_decode(const std::string& encoded);

}
