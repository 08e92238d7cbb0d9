#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace voxpipe {

std::string base64_encode(const uint8_t* data, size_t len);
std::string base64_encode(const std::vector<uint8_t>& data);

// Returns false on characters outside the standard alphabet or bad padding.
// Whitespace is skipped.
bool base64_decode(const std::string& in, std::vector<uint8_t>& out);

} // namespace voxpipe
