#include "pcm.h"
#include <cmath>

namespace voxpipe {

std::vector<int16_t> pcm16_from_bytes(const std::vector<uint8_t>& bytes) {
  std::vector<int16_t> out(bytes.size() / 2);
  for (size_t i = 0; i < out.size(); ++i) {
    uint16_t lo = bytes[2 * i];
    uint16_t hi = bytes[2 * i + 1];
    out[i] = static_cast<int16_t>(lo | (hi << 8));
  }
  return out;
}

std::vector<uint8_t> pcm16_to_bytes(const std::vector<int16_t>& samples) {
  std::vector<uint8_t> out(samples.size() * 2);
  for (size_t i = 0; i < samples.size(); ++i) {
    uint16_t v = static_cast<uint16_t>(samples[i]);
    out[2 * i] = static_cast<uint8_t>(v & 0xFF);
    out[2 * i + 1] = static_cast<uint8_t>(v >> 8);
  }
  return out;
}

double pcm16_rms(const int16_t* samples, size_t count) {
  if (count == 0) return 0.0;
  int64_t sum = 0;
  for (size_t i = 0; i < count; i++) {
    sum += (int64_t)samples[i] * samples[i];
  }
  return std::sqrt(static_cast<double>(sum) / static_cast<double>(count));
}

std::vector<int16_t> sine_tone(double freq_hz, int sample_rate, size_t first_sample,
                               size_t count, double amplitude) {
  std::vector<int16_t> out(count);
  const double two_pi = 6.283185307179586;
  for (size_t i = 0; i < count; ++i) {
    double t = static_cast<double>(first_sample + i) / sample_rate;
    double v = amplitude * std::sin(two_pi * freq_hz * t);
    if (v > 1.0) v = 1.0;
    if (v < -1.0) v = -1.0;
    out[i] = static_cast<int16_t>(v * 32767.0);
  }
  return out;
}

} // namespace voxpipe
