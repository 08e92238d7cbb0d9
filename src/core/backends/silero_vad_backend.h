#pragma once
#include "task_backend.h"
#include <memory>
#include <vector>

namespace voxpipe {

struct VadSegment {
  double start = 0.0;  // seconds
  double end = 0.0;
  double confidence = 0.0;
};

// Groups per-window speech probabilities into segments. Speech that is
// shorter than min_speech_ms is dropped; gaps shorter than min_silence_ms do
// not split a segment.
std::vector<VadSegment> segments_from_probabilities(const std::vector<float>& probs, size_t window,
                                                    int sample_rate, float threshold,
                                                    int min_speech_ms, int min_silence_ms);

// detect-voice-activity backend. Runs the Silero VAD model through
// onnxruntime when a model file is configured, frame energy otherwise.
class VoiceActivityBackend : public TaskBackend {
public:
  explicit VoiceActivityBackend(std::string model_path);
  ~VoiceActivityBackend() override;

  const char* name() const override;
  void load() override;
  Json::Value execute(const Json::Value& payload, const ChunkSink& emit_chunk) override;

  bool neural() const;
  // One probability per window (512 samples at 16 kHz, 256 at 8 kHz).
  std::vector<float> probabilities(const std::vector<int16_t>& pcm, int sample_rate, size_t& window);

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
  std::string model_path_;
};

} // namespace voxpipe
