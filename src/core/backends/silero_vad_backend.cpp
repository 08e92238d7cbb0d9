#include "silero_vad_backend.h"
#include <onnxruntime_cxx_api.h>
#include <algorithm>
#include <cmath>
#include <iostream>
#include "../audio/pcm.h"

namespace voxpipe {

namespace {

const int64_t kStateSize = 2 * 1 * 128;

float energy_probability(const int16_t* samples, size_t count) {
  double rms = pcm16_rms(samples, count);
  // 500 RMS, the silence floor used elsewhere, maps to 0.5
  return static_cast<float>(rms / (rms + 500.0));
}

} // namespace

struct VoiceActivityBackend::Impl {
  Ort::Env env{ORT_LOGGING_LEVEL_WARNING, "silero_vad"};
  Ort::SessionOptions session_options;
  std::unique_ptr<Ort::Session> session;
  Ort::MemoryInfo memory_info{Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault)};

  std::vector<float> state;
  std::vector<float> context;

  explicit Impl(const std::string& path) {
    session_options.SetIntraOpNumThreads(1);
    session_options.SetInterOpNumThreads(1);
    session.reset(new Ort::Session(env, path.c_str(), session_options));
  }

  void reset(size_t context_size) {
    state.assign(kStateSize, 0.0f);
    context.assign(context_size, 0.0f);
  }

  float run_window(const int16_t* samples, size_t window, int sample_rate) {
    std::vector<float> input(context.size() + window);
    std::copy(context.begin(), context.end(), input.begin());
    for (size_t i = 0; i < window; ++i) {
      input[context.size() + i] = static_cast<float>(samples[i]) / 32768.0f;
    }

    std::vector<int64_t> input_shape{1, static_cast<int64_t>(input.size())};
    std::vector<int64_t> state_shape{2, 1, 128};
    std::vector<int64_t> sr_shape{1};
    int64_t sr = sample_rate;

    std::vector<Ort::Value> inputs;
    inputs.push_back(Ort::Value::CreateTensor<float>(memory_info, input.data(), input.size(),
                                                     input_shape.data(), input_shape.size()));
    inputs.push_back(Ort::Value::CreateTensor<float>(memory_info, state.data(), state.size(),
                                                     state_shape.data(), state_shape.size()));
    inputs.push_back(Ort::Value::CreateTensor<int64_t>(memory_info, &sr, 1, sr_shape.data(), sr_shape.size()));

    const char* input_names[] = {"input", "state", "sr"};
    const char* output_names[] = {"output", "stateN"};
    auto outputs = session->Run(Ort::RunOptions{nullptr}, input_names, inputs.data(), inputs.size(),
                                output_names, 2);

    float prob = outputs[0].GetTensorMutableData<float>()[0];
    const float* next_state = outputs[1].GetTensorMutableData<float>();
    std::copy(next_state, next_state + kStateSize, state.begin());
    std::copy(input.end() - static_cast<std::ptrdiff_t>(context.size()), input.end(), context.begin());
    return prob;
  }
};

std::vector<VadSegment> segments_from_probabilities(const std::vector<float>& probs, size_t window,
                                                    int sample_rate, float threshold,
                                                    int min_speech_ms, int min_silence_ms) {
  std::vector<VadSegment> segments;
  if (probs.empty() || window == 0 || sample_rate <= 0) return segments;

  const double window_s = static_cast<double>(window) / sample_rate;
  const size_t min_speech = static_cast<size_t>(std::ceil(min_speech_ms / 1000.0 / window_s));
  const size_t min_silence = static_cast<size_t>(std::ceil(min_silence_ms / 1000.0 / window_s));
  const float neg_threshold = std::max(threshold - 0.15f, 0.01f);

  bool in_speech = false;
  size_t start = 0;
  size_t silence_start = 0;
  bool in_silence = false;

  auto close = [&](size_t end) {
    if (end - start >= std::max<size_t>(min_speech, 1)) {
      double sum = 0.0;
      for (size_t i = start; i < end; ++i) sum += probs[i];
      VadSegment seg;
      seg.start = start * window_s;
      seg.end = end * window_s;
      seg.confidence = sum / static_cast<double>(end - start);
      segments.push_back(seg);
    }
  };

  for (size_t i = 0; i < probs.size(); ++i) {
    float p = probs[i];
    if (!in_speech) {
      if (p >= threshold) {
        in_speech = true;
        start = i;
        in_silence = false;
      }
      continue;
    }
    if (p >= neg_threshold) {
      in_silence = false;
      continue;
    }
    if (!in_silence) {
      in_silence = true;
      silence_start = i;
    }
    if (i + 1 - silence_start >= min_silence) {
      close(silence_start);
      in_speech = false;
      in_silence = false;
    }
  }
  if (in_speech) close(in_silence ? silence_start : probs.size());
  return segments;
}

VoiceActivityBackend::VoiceActivityBackend(std::string model_path) : model_path_(std::move(model_path)) {}

VoiceActivityBackend::~VoiceActivityBackend() = default;

const char* VoiceActivityBackend::name() const {
  return impl_ ? "silero" : "energy";
}

bool VoiceActivityBackend::neural() const {
  return impl_ != nullptr;
}

void VoiceActivityBackend::load() {
  if (model_path_.empty()) {
    std::cerr << "[SileroVad] MODEL_NOT_CONFIGURED engine=energy\n";
    return;
  }
  try {
    impl_.reset(new Impl(model_path_));
  } catch (const Ort::Exception& e) {
    throw std::runtime_error("failed to load VAD model " + model_path_ + ": " + e.what());
  }
  std::cerr << "[SileroVad] MODEL_LOADED path=" << model_path_ << "\n";
}

std::vector<float> VoiceActivityBackend::probabilities(const std::vector<int16_t>& pcm, int sample_rate,
                                                       size_t& window) {
  std::vector<float> probs;
  const bool silero_rate = sample_rate == 16000 || sample_rate == 8000;
  window = sample_rate == 8000 ? 256 : 512;
  if (!silero_rate) window = ms_to_samples(32, sample_rate);
  if (window == 0) return probs;

  const bool use_model = impl_ && silero_rate;
  if (use_model) impl_->reset(sample_rate == 16000 ? 64 : 32);
  for (size_t off = 0; off + window <= pcm.size(); off += window) {
    if (use_model) {
      try {
        probs.push_back(impl_->run_window(pcm.data() + off, window, sample_rate));
      } catch (const Ort::Exception& e) {
        throw BackendError(ErrorKind::TaskFailed, std::string("VAD inference failed: ") + e.what());
      }
    } else {
      probs.push_back(energy_probability(pcm.data() + off, window));
    }
  }
  return probs;
}

Json::Value VoiceActivityBackend::execute(const Json::Value& payload, const ChunkSink&) {
  std::vector<int16_t> pcm = require_pcm(payload, "audio");
  int sample_rate = payload.get("sample_rate", 16000).asInt();
  if (sample_rate < 8000 || sample_rate > 48000) {
    throw BackendError(ErrorKind::InvalidPayload, "sample_rate out of range");
  }
  float threshold = payload.get("threshold", 0.5).asFloat();
  int min_speech_ms = payload.get("min_speech_ms", 250).asInt();
  int min_silence_ms = payload.get("min_silence_ms", 100).asInt();

  size_t window = 0;
  std::vector<float> probs = probabilities(pcm, sample_rate, window);
  std::vector<VadSegment> segs =
      segments_from_probabilities(probs, window, sample_rate, threshold, min_speech_ms, min_silence_ms);

  Json::Value out(Json::objectValue);
  out["engine"] = (impl_ && (sample_rate == 16000 || sample_rate == 8000)) ? "silero" : "energy";
  out["duration"] = static_cast<double>(pcm.size()) / sample_rate;
  Json::Value& arr = out["segments"];
  arr = Json::Value(Json::arrayValue);
  double speech = 0.0;
  for (const auto& s : segs) {
    Json::Value v;
    v["start"] = s.start;
    v["end"] = s.end;
    v["confidence"] = s.confidence;
    arr.append(v);
    speech += s.end - s.start;
  }
  out["speech_duration"] = speech;
  return out;
}

} // namespace voxpipe
