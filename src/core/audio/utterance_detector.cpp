#include "utterance_detector.h"
#include "pcm.h"

namespace voxpipe {

UtteranceDetector::UtteranceDetector(UtteranceConfig cfg) : cfg_(cfg) {}

void UtteranceDetector::reconfigure(const UtteranceConfig& cfg) {
  cfg_ = cfg;
  reset();
}

void UtteranceDetector::reset() {
  buffer_.clear();
  analysed_ = 0;
  speech_samples_ = 0;
  trailing_silence_ = 0;
}

int64_t UtteranceDetector::buffered_ms() const {
  return samples_to_ms(buffer_.size(), cfg_.sample_rate);
}

int64_t UtteranceDetector::speech_ms() const {
  return samples_to_ms(speech_samples_, cfg_.sample_rate);
}

bool UtteranceDetector::push(const std::vector<int16_t>& samples) {
  buffer_.insert(buffer_.end(), samples.begin(), samples.end());

  const size_t frame = ms_to_samples(cfg_.frame_ms, cfg_.sample_rate);
  const size_t gap = ms_to_samples(cfg_.gap_ms, cfg_.sample_rate);
  if (frame == 0) return false;

  while (analysed_ + frame <= buffer_.size()) {
    double level = pcm16_rms(buffer_.data() + analysed_, frame);
    analysed_ += frame;
    if (level >= cfg_.silence_rms) {
      speech_samples_ += frame;
      trailing_silence_ = 0;
    } else {
      trailing_silence_ += frame;
    }
  }

  if (speech_samples_ == 0 && analysed_ > gap) {
    size_t drop = analysed_ - gap;
    buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(drop));
    analysed_ -= drop;
    trailing_silence_ = analysed_;
  }

  if (buffered_ms() >= cfg_.max_utterance_ms && speech_samples_ > 0) return true;
  if (trailing_silence_ >= gap && speech_samples_ > 0) {
    if (speech_ms() >= cfg_.min_speech_ms) return true;
    // noise burst followed by silence: drop it
    size_t keep = trailing_silence_;
    size_t drop = analysed_ - keep;
    buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(drop));
    analysed_ = keep;
    speech_samples_ = 0;
    trailing_silence_ = keep;
  }
  return false;
}

std::vector<int16_t> UtteranceDetector::take() {
  std::vector<int16_t> out;
  out.swap(buffer_);
  analysed_ = 0;
  speech_samples_ = 0;
  trailing_silence_ = 0;
  return out;
}

} // namespace voxpipe
