#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace voxpipe {

struct UtteranceConfig {
  int sample_rate = 16000;
  int frame_ms = 20;
  int gap_ms = 700;            // trailing silence that closes an utterance
  double silence_rms = 500.0;  // frames below this level are silence
  int min_speech_ms = 200;     // shorter bursts are treated as noise
  int max_utterance_ms = 30000;
};

// Energy-based end-of-speech detection over a stream of PCM16 samples.
// Leading silence is trimmed to one gap of pre-roll so the buffer stays
// bounded while the user is quiet.
class UtteranceDetector {
public:
  explicit UtteranceDetector(UtteranceConfig cfg = UtteranceConfig());

  // Appends samples; returns true once an utterance boundary is reached.
  bool push(const std::vector<int16_t>& samples);

  // Explicit end of turn from the client. True if anything is buffered.
  bool force_boundary() const { return !buffer_.empty(); }

  // Moves the buffered utterance out and resets detection state.
  std::vector<int16_t> take();
  void reset();
  void reconfigure(const UtteranceConfig& cfg);

  bool speech_seen() const { return speech_samples_ > 0; }
  int64_t buffered_ms() const;
  int64_t speech_ms() const;

private:
  UtteranceConfig cfg_;
  std::vector<int16_t> buffer_;
  size_t analysed_ = 0;
  size_t speech_samples_ = 0;
  size_t trailing_silence_ = 0;
};

} // namespace voxpipe
