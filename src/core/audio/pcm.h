#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace voxpipe {

// PCM16 little-endian mono helpers.
std::vector<int16_t> pcm16_from_bytes(const std::vector<uint8_t>& bytes);
std::vector<uint8_t> pcm16_to_bytes(const std::vector<int16_t>& samples);

double pcm16_rms(const int16_t* samples, size_t count);

// Continuous sine: `first_sample` lets a stream be produced chunk by chunk
// without phase jumps.
std::vector<int16_t> sine_tone(double freq_hz, int sample_rate, size_t first_sample,
                               size_t count, double amplitude);

inline int64_t samples_to_ms(size_t samples, int sample_rate) {
  return sample_rate > 0 ? static_cast<int64_t>(samples) * 1000 / sample_rate : 0;
}

inline size_t ms_to_samples(int64_t ms, int sample_rate) {
  return ms > 0 ? static_cast<size_t>(ms * sample_rate / 1000) : 0;
}

} // namespace voxpipe
