#include "core/backends/silero_vad_backend.h"
#include "core/audio/pcm.h"
#include "core/codec/base64.h"
#include <cmath>
#include <iostream>
#include <cassert>

using namespace voxpipe;

int main() {
  // hysteresis: a dip above neg_threshold does not split the segment
  std::vector<float> probs{0.1f, 0.9f, 0.9f, 0.4f, 0.9f, 0.9f, 0.1f, 0.1f, 0.1f, 0.1f, 0.1f};
  auto segs = segments_from_probabilities(probs, 512, 16000, 0.5f, 32, 100);
  assert(segs.size() == 1);
  assert(std::fabs(segs[0].start - 0.032) < 1e-9);
  assert(std::fabs(segs[0].end - 0.192) < 1e-9);

  // a deep dip long enough splits it; a blip shorter than min speech is dropped
  std::vector<float> split{0.9f, 0.9f, 0.9f, 0.0f, 0.0f, 0.0f, 0.0f, 0.9f, 0.9f, 0.9f, 0.0f, 0.0f, 0.0f, 0.0f, 0.9f};
  segs = segments_from_probabilities(split, 512, 16000, 0.5f, 64, 100);
  assert(segs.size() == 2);
  assert(segs[1].start > segs[0].end);
  for (const auto& s : segs) assert(s.confidence > 0.85);
  assert(segments_from_probabilities({}, 512, 16000, 0.5f, 250, 100).empty());

  // no model configured: energy engine
  VoiceActivityBackend vad("");
  vad.load();
  assert(!vad.neural());
  assert(std::string(vad.name()) == "energy");

  std::vector<int16_t> pcm(8000, 0);
  std::vector<int16_t> tone = sine_tone(440.0, 16000, 0, 16000, 0.5);
  pcm.insert(pcm.end(), tone.begin(), tone.end());
  pcm.resize(pcm.size() + 8000, 0);

  Json::Value payload;
  payload["audio"] = base64_encode(pcm16_to_bytes(pcm));
  payload["sample_rate"] = 16000;
  Json::Value out = vad.execute(payload, [](Json::Value) {});
  assert(out["engine"].asString() == "energy");
  assert(std::fabs(out["duration"].asDouble() - 2.0) < 1e-9);
  assert(out["segments"].size() == 1);
  double start = out["segments"][0]["start"].asDouble();
  double end = out["segments"][0]["end"].asDouble();
  std::cout << "segment " << start << " - " << end << "\n";
  assert(std::fabs(start - 0.48) < 0.04);
  assert(std::fabs(end - 1.5) < 0.04);
  assert(std::fabs(out["speech_duration"].asDouble() - (end - start)) < 1e-9);

  // all silence
  Json::Value quiet;
  quiet["audio"] = base64_encode(pcm16_to_bytes(std::vector<int16_t>(16000, 0)));
  out = vad.execute(quiet, [](Json::Value) {});
  assert(out["segments"].size() == 0);
  assert(out["speech_duration"].asDouble() == 0.0);

  // bad payloads are typed
  bool threw = false;
  try {
    Json::Value bad;
    bad["audio"] = "%%%";
    vad.execute(bad, [](Json::Value) {});
  } catch (const BackendError& e) {
    threw = e.kind() == ErrorKind::InvalidPayload;
  }
  assert(threw);

  // a missing model file fails at load time
  VoiceActivityBackend missing("/nonexistent/silero_vad.onnx");
  threw = false;
  try {
    missing.load();
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  std::cout << "Silero VAD backend test PASSED\n";
  return 0;
}
