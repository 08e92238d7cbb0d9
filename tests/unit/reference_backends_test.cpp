#include "core/backends/reference_backends.h"
#include "core/audio/pcm.h"
#include "core/codec/base64.h"
#include <cmath>
#include <iostream>
#include <cassert>

using namespace voxpipe;

static std::string encode_pcm(const std::vector<int16_t>& pcm) {
  return base64_encode(pcm16_to_bytes(pcm));
}

static std::vector<int16_t> speech_like(double seconds, int sr) {
  // half quiet, half loud: a clean recording by the SNR estimate
  size_t n = static_cast<size_t>(seconds * sr);
  std::vector<int16_t> pcm(n / 2, 0);
  std::vector<int16_t> t = sine_tone(220.0, sr, 0, n - n / 2, 0.5);
  pcm.insert(pcm.end(), t.begin(), t.end());
  return pcm;
}

static bool throws_invalid(TaskBackend& b, const Json::Value& payload) {
  try {
    b.execute(payload, [](Json::Value) {});
  } catch (const BackendError& e) {
    return e.kind() == ErrorKind::InvalidPayload;
  }
  return false;
}

static void test_transcribe() {
  TranscribeBackend stt;
  std::vector<Json::Value> chunks;
  auto sink = [&](Json::Value c) { chunks.push_back(c); };

  Json::Value p;
  p["text"] = "the quick brown fox jumps";
  Json::Value out = stt.execute(p, sink);
  assert(out["text"].asString() == "the quick brown fox jumps");
  assert(chunks.size() == 1 && chunks[0]["text"].asString() == "the quick");

  chunks.clear();
  std::vector<int16_t> pcm = sine_tone(300.0, 16000, 0, 16000, 0.5);
  pcm.resize(24000, 0);
  Json::Value a;
  a["audio"] = encode_pcm(pcm);
  out = stt.execute(a, sink);
  assert(out["text"].asString() == "[speech 1.0s]");
  assert(out["duration_ms"].asInt() == 1500);
  assert(chunks.empty());

  a["audio"] = encode_pcm(std::vector<int16_t>(16000, 0));
  out = stt.execute(a, sink);
  assert(out["text"].asString().empty());
  assert(out["confidence"].asDouble() == 0.0);

  a["audio"] = encode_pcm(sine_tone(300.0, 16000, 0, 48000, 0.5));
  out = stt.execute(a, sink);
  assert(chunks.size() == 1);
  assert(out["text"].asString() == "[speech 3.0s]");

  Json::Value bad;
  bad["audio"] = 12;
  assert(throws_invalid(stt, bad));
  a["sample_rate"] = 1000;
  assert(throws_invalid(stt, a));
  std::cout << "transcribe ok\n";
}

static void test_generate_and_synthesize() {
  GenerateReplyBackend gen;
  Json::Value p;
  Json::Value u1, a1, u2;
  u1["role"] = "user";
  u1["text"] = "first";
  a1["role"] = "assistant";
  a1["text"] = "ok";
  u2["role"] = "user";
  u2["text"] = "second";
  p["context"].append(u1);
  p["context"].append(a1);
  p["context"].append(u2);
  Json::Value out = gen.execute(p, [](Json::Value) {});
  assert(out["text"].asString() == "I received: \"second\"");
  assert(out["turns_seen"].asInt() == 3);

  Json::Value only_assistant;
  only_assistant["context"].append(a1);
  assert(throws_invalid(gen, only_assistant));
  assert(throws_invalid(gen, Json::Value(Json::objectValue)));

  SynthesizeBackend tts;
  int samples = 0;
  int seq = 0;
  Json::Value s;
  s["text"] = "hi";                 // short text: 200ms floor
  s["sample_rate"] = 8000;
  s["chunk_ms"] = 50;
  out = tts.execute(s, [&](Json::Value c) {
    std::vector<uint8_t> bytes;
    assert(base64_decode(c["audio"].asString(), bytes));
    assert(static_cast<int>(bytes.size()) == 2 * c["samples"].asInt());
    assert(c["sample_rate"].asInt() == 8000);
    samples += c["samples"].asInt();
    ++seq;
  });
  assert(out["duration_ms"].asInt() == 200);
  assert(samples == 1600);
  assert(seq == 4 && out["chunks"].asInt() == 4);
  assert(out["voice"].asString() == "default");

  s["text"] = std::string(1000, 'a');   // capped at 15s
  s["chunk_ms"] = 1000;
  out = tts.execute(s, [](Json::Value) {});
  assert(out["duration_ms"].asInt() == 15000);
  assert(out["chunks"].asInt() == 15);

  s["text"] = "";
  assert(throws_invalid(tts, s));
  std::cout << "generate and synthesize ok\n";
}

static void test_clone_voice() {
  CloneVoiceBackend clone;
  auto run = [&](const Json::Value& p) { return clone.execute(p, [](Json::Value) {}); };

  Json::Value p;
  p["action"] = "create_instant";
  p["clone_id"] = "c1";
  p["name"] = "Ada";
  p["sample_rate"] = 8000;
  p["audio"] = encode_pcm(speech_like(6.0, 8000));
  Json::Value out = run(p);
  assert(out["status"].asString() == "ready");
  assert(out["training_progress"].asInt() == 100);
  assert(std::fabs(out["quality_score"].asDouble() - 0.85) < 1e-9);
  assert(out["snr_db"].asDouble() >= 20.0);

  p["clone_id"] = "c2";
  p["audio"] = encode_pcm(speech_like(3.0, 8000));
  out = run(p);
  assert(out["status"].asString() == "failed");
  assert(out["message"].asString().find("at least") != std::string::npos);

  // constant level everywhere: no quiet floor to measure against
  p["clone_id"] = "c3";
  p["audio"] = encode_pcm(sine_tone(220.0, 8000, 0, 8000 * 8, 0.5));
  out = run(p);
  assert(out["status"].asString() == "failed");
  assert(out["message"].asString().find("quality") != std::string::npos);

  Json::Value pro = p;
  pro["action"] = "create_professional";
  pro["clone_id"] = "c4";
  pro["audio"] = encode_pcm(speech_like(70.0, 8000));
  out = run(pro);
  assert(out["status"].asString() == "processing");
  assert(out["training_progress"].asInt() == 0);

  Json::Value status;
  status["action"] = "get_status";
  status["clone_id"] = "c4";
  for (int step = 1; step <= 4; ++step) {
    out = run(status);
    assert(out["training_progress"].asInt() == 25 * step);
  }
  assert(out["status"].asString() == "ready");
  assert(std::fabs(out["quality_score"].asDouble() - 0.95) < 1e-9);

  Json::Value syn;
  syn["action"] = "create_synthetic";
  syn["clone_id"] = "c5";
  syn["description"] = "warm narrator";
  syn["characteristics"]["pace"] = 0.8;
  out = run(syn);
  assert(out["status"].asString() == "ready");
  assert(std::fabs(out["quality_score"].asDouble() - 0.90) < 1e-9);
  assert(out["characteristics"]["pace"].asDouble() == 0.8);
  assert(out["characteristics"]["pitch"].asDouble() == 150.0);

  status["clone_id"] = "c5";
  assert(run(status)["status"].asString() == "ready");
  status["clone_id"] = "missing";
  assert(throws_invalid(clone, status));
  Json::Value unknown;
  unknown["action"] = "delete";
  assert(throws_invalid(clone, unknown));
  std::cout << "clone voice ok\n";
}

int main() {
  test_transcribe();
  test_generate_and_synthesize();
  test_clone_voice();

  BackendOptions opts;
  for (int t = 0; t < kTaskTypeCount; ++t) {
    auto b = make_backend(static_cast<TaskType>(t), opts);
    assert(b != nullptr);
  }
  std::cout << "Reference backends test PASSED\n";
  return 0;
}
