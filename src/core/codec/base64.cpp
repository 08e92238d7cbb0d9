#include "base64.h"

namespace voxpipe {

namespace {

const char kTable[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int decode_char(char c) {
  if (c >= 'A' && c <= 'Z') return c - 'A';
  if (c >= 'a' && c <= 'z') return c - 'a' + 26;
  if (c >= '0' && c <= '9') return c - '0' + 52;
  if (c == '+') return 62;
  if (c == '/') return 63;
  return -1;
}

} // namespace

std::string base64_encode(const uint8_t* data, size_t len) {
  std::string result;
  result.reserve(((len + 2) / 3) * 4);
  for (size_t i = 0; i < len; i += 3) {
    const uint32_t a = data[i];
    const uint32_t b = (i + 1 < len) ? data[i + 1] : 0;
    const uint32_t c = (i + 2 < len) ? data[i + 2] : 0;
    const uint32_t triple = (a << 16) | (b << 8) | c;
    result += kTable[(triple >> 18) & 0x3F];
    result += kTable[(triple >> 12) & 0x3F];
    result += (i + 1 < len) ? kTable[(triple >> 6) & 0x3F] : '=';
    result += (i + 2 < len) ? kTable[triple & 0x3F] : '=';
  }
  return result;
}

std::string base64_encode(const std::vector<uint8_t>& data) {
  return base64_encode(data.data(), data.size());
}

bool base64_decode(const std::string& in, std::vector<uint8_t>& out) {
  out.clear();
  out.reserve(in.size() / 4 * 3);
  uint32_t acc = 0;
  int bits = 0;
  int pad = 0;
  for (char c : in) {
    if (c == ' ' || c == '\n' || c == '\r' || c == '\t') continue;
    if (c == '=') {
      ++pad;
      if (pad > 2) return false;
      continue;
    }
    if (pad > 0) return false; // data after padding
    int v = decode_char(c);
    if (v < 0) return false;
    acc = (acc << 6) | static_cast<uint32_t>(v);
    bits += 6;
    if (bits >= 8) {
      bits -= 8;
      out.push_back(static_cast<uint8_t>((acc >> bits) & 0xFF));
    }
  }
  // leftover bits must be zero padding from the last sextet
  if (bits >= 6) return false;
  return true;
}

} // namespace voxpipe
