#include "reference_backends.h"
#include "../audio/pcm.h"
#include "../codec/base64.h"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <sstream>

namespace voxpipe {

namespace {

const double kSpeechRms = 500.0;
const int kFrameMs = 20;

std::string seconds_label(int64_t ms) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.1f", static_cast<double>(ms) / 1000.0);
  return buf;
}

int sample_rate_of(const Json::Value& payload) {
  int sr = payload.get("sample_rate", 16000).asInt();
  if (sr < 8000 || sr > 48000) {
    throw BackendError(ErrorKind::InvalidPayload, "sample_rate out of range: " + std::to_string(sr));
  }
  return sr;
}

std::vector<double> frame_levels(const std::vector<int16_t>& pcm, int sample_rate) {
  std::vector<double> levels;
  size_t frame = ms_to_samples(kFrameMs, sample_rate);
  for (size_t off = 0; frame > 0 && off + frame <= pcm.size(); off += frame) {
    levels.push_back(pcm16_rms(pcm.data() + off, frame));
  }
  return levels;
}

// Loud-frame level over quiet-frame level, in dB.
double estimate_snr_db(std::vector<double> levels) {
  if (levels.size() < 2) return 0.0;
  std::sort(levels.begin(), levels.end());
  double noise = levels[levels.size() / 10];
  double signal = levels[levels.size() * 9 / 10];
  if (noise < 1.0) noise = 1.0;
  if (signal <= noise) return 0.0;
  return 20.0 * std::log10(signal / noise);
}

} // namespace

Json::Value TranscribeBackend::execute(const Json::Value& payload, const ChunkSink& emit_chunk) {
  Json::Value out(Json::objectValue);
  out["language"] = payload.get("language", "en").asString();

  if (payload.isMember("text")) {
    std::string text = require_string(payload, "text");
    std::istringstream ss(text);
    std::vector<std::string> words;
    std::string w;
    while (ss >> w) words.push_back(w);
    if (words.size() > 3) {
      std::string partial;
      for (size_t i = 0; i < words.size() / 2; ++i) {
        if (i) partial += ' ';
        partial += words[i];
      }
      Json::Value chunk;
      chunk["text"] = partial;
      emit_chunk(chunk);
    }
    out["text"] = text;
    out["confidence"] = 1.0;
    out["duration_ms"] = 0;
    return out;
  }

  std::vector<int16_t> pcm = require_pcm(payload, "audio");
  int sr = sample_rate_of(payload);
  std::vector<double> levels = frame_levels(pcm, sr);
  int64_t speech_ms = 0;
  for (double l : levels) {
    if (l >= kSpeechRms) speech_ms += kFrameMs;
  }
  int64_t duration_ms = samples_to_ms(pcm.size(), sr);

  if (speech_ms == 0) {
    out["text"] = "";
    out["confidence"] = 0.0;
  } else {
    if (duration_ms > 2000) {
      Json::Value chunk;
      chunk["text"] = "[speech";
      emit_chunk(chunk);
    }
    out["text"] = "[speech " + seconds_label(speech_ms) + "s]";
    double ratio = duration_ms > 0 ? static_cast<double>(speech_ms) / duration_ms : 0.0;
    out["confidence"] = std::min(1.0, 0.5 + ratio / 2.0);
  }
  out["duration_ms"] = static_cast<Json::Int64>(duration_ms);
  out["speech_ms"] = static_cast<Json::Int64>(speech_ms);
  return out;
}

Json::Value GenerateReplyBackend::execute(const Json::Value& payload, const ChunkSink&) {
  const Json::Value& ctx = payload["context"];
  if (!ctx.isArray()) {
    throw BackendError(ErrorKind::InvalidPayload, "payload field 'context' must be an array");
  }
  std::string last_user;
  bool found = false;
  for (Json::ArrayIndex i = ctx.size(); i > 0; --i) {
    const Json::Value& turn = ctx[i - 1];
    if (turn.get("role", "").asString() == "user") {
      last_user = turn.get("text", "").asString();
      found = true;
      break;
    }
  }
  if (!found) throw BackendError(ErrorKind::InvalidPayload, "context has no user turn");

  Json::Value out(Json::objectValue);
  out["text"] = "I received: \"" + last_user + "\"";
  out["turns_seen"] = ctx.size();
  out["language"] = payload.get("language", "en").asString();
  return out;
}

Json::Value SynthesizeBackend::execute(const Json::Value& payload, const ChunkSink& emit_chunk) {
  std::string text = require_string(payload, "text");
  if (text.empty()) throw BackendError(ErrorKind::InvalidPayload, "nothing to synthesize");
  int sr = sample_rate_of(payload);
  int chunk_ms = std::max(20, std::min(1000, payload.get("chunk_ms", 200).asInt()));

  int64_t duration_ms = std::max<int64_t>(200, std::min<int64_t>(15000, static_cast<int64_t>(text.size()) * 50));
  const size_t total = ms_to_samples(duration_ms, sr);
  const size_t per_chunk = ms_to_samples(chunk_ms, sr);

  int chunks = 0;
  for (size_t pos = 0; pos < total; pos += per_chunk) {
    size_t n = std::min(per_chunk, total - pos);
    std::vector<int16_t> samples = sine_tone(440.0, sr, pos, n, 0.3);
    Json::Value chunk;
    chunk["audio"] = base64_encode(pcm16_to_bytes(samples));
    chunk["samples"] = static_cast<Json::UInt64>(n);
    chunk["sample_rate"] = sr;
    emit_chunk(chunk);
    ++chunks;
  }

  Json::Value out(Json::objectValue);
  out["duration_ms"] = static_cast<Json::Int64>(duration_ms);
  out["chunks"] = chunks;
  out["sample_rate"] = sr;
  out["voice"] = payload.get("voice", "default").asString();
  return out;
}

Json::Value CloneVoiceBackend::execute(const Json::Value& payload, const ChunkSink&) {
  std::string action = require_string(payload, "action");
  if (action == "create_instant") return create_from_audio(payload, "instant", 5.0);
  if (action == "create_professional") return create_from_audio(payload, "professional", 60.0);
  if (action == "create_synthetic") return create_synthetic(payload);
  if (action == "get_status") return get_status(payload);
  throw BackendError(ErrorKind::InvalidPayload, "unknown clone action '" + action + "'");
}

Json::Value CloneVoiceBackend::create_from_audio(const Json::Value& payload, const std::string& mode,
                                                 double min_seconds) {
  std::string clone_id = require_string(payload, "clone_id");
  std::vector<int16_t> pcm = require_pcm(payload, "audio");
  int sr = sample_rate_of(payload);
  double seconds = static_cast<double>(pcm.size()) / sr;

  Json::Value out(Json::objectValue);
  out["clone_id"] = clone_id;
  out["mode"] = mode;
  out["sample_duration"] = seconds;

  std::string problem;
  if (seconds < min_seconds) {
    problem = mode + " clone requires at least " + seconds_label(static_cast<int64_t>(min_seconds * 1000)) + "s of audio";
  } else if (seconds > 300.0) {
    problem = "audio too long (max 300s)";
  }
  double snr = estimate_snr_db(frame_levels(pcm, sr));
  if (problem.empty() && snr < 20.0) problem = "audio quality too low (background noise detected)";
  if (!problem.empty()) {
    out["status"] = "failed";
    out["quality_score"] = 0.0;
    out["training_progress"] = 0;
    out["message"] = problem;
    return out;
  }

  Clone c;
  c.name = payload.get("name", "Untitled").asString();
  c.mode = mode;
  double confidence = std::min(1.0, snr / 40.0);
  if (mode == "instant") {
    c.status = "ready";
    c.training_progress = 100;
    c.quality_score = confidence * 0.85;
  } else {
    c.status = "processing";
    c.training_progress = 0;
  }
  clones_[clone_id] = c;

  out["status"] = c.status;
  out["training_progress"] = c.training_progress;
  out["quality_score"] = c.quality_score;
  out["snr_db"] = snr;
  out["confidence"] = confidence;
  out["rms"] = pcm16_rms(pcm.data(), pcm.size());
  out["message"] = c.status == "ready" ? "instant clone created" : "fine-tuning in progress";
  return out;
}

Json::Value CloneVoiceBackend::create_synthetic(const Json::Value& payload) {
  std::string clone_id = require_string(payload, "clone_id");
  const Json::Value& ch = payload["characteristics"];

  Clone c;
  c.name = payload.get("name", "Untitled").asString();
  c.mode = "synthetic";
  c.status = "ready";
  c.training_progress = 100;
  c.quality_score = 0.90;
  clones_[clone_id] = c;

  Json::Value out(Json::objectValue);
  out["clone_id"] = clone_id;
  out["mode"] = c.mode;
  out["status"] = c.status;
  out["training_progress"] = c.training_progress;
  out["quality_score"] = c.quality_score;
  Json::Value& chars = out["characteristics"];
  chars["pitch"] = ch.get("pitch", 150).asDouble();
  chars["pace"] = ch.get("pace", 1.0).asDouble();
  chars["energy"] = ch.get("energy", 0.7).asDouble();
  chars["tone"] = ch.get("tone", "neutral").asString();
  chars["gender"] = ch.get("gender", "neutral").asString();
  out["message"] = "synthetic voice created: " + payload.get("description", "").asString();
  return out;
}

Json::Value CloneVoiceBackend::get_status(const Json::Value& payload) {
  std::string clone_id = require_string(payload, "clone_id");
  auto it = clones_.find(clone_id);
  if (it == clones_.end()) throw BackendError(ErrorKind::InvalidPayload, "clone not found: " + clone_id);

  // Professional clones advance one training step per status poll.
  Clone& c = it->second;
  if (c.status == "processing") {
    c.training_progress = std::min(100, c.training_progress + 25);
    if (c.training_progress == 100) {
      c.status = "ready";
      c.quality_score = 0.95;
    }
  }

  Json::Value out(Json::objectValue);
  out["clone_id"] = clone_id;
  out["mode"] = c.mode;
  out["status"] = c.status;
  out["training_progress"] = c.training_progress;
  out["quality_score"] = c.quality_score;
  return out;
}

} // namespace voxpipe
