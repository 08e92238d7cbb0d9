#pragma once
#include "task_backend.h"
#include <map>

namespace voxpipe {

// Deterministic stand-ins for the inference engines. They honour the same
// payload contracts so the dispatch layer runs end to end.

class TranscribeBackend : public TaskBackend {
public:
  const char* name() const override { return "reference-transcribe"; }
  Json::Value execute(const Json::Value& payload, const ChunkSink& emit_chunk) override;
};

class GenerateReplyBackend : public TaskBackend {
public:
  const char* name() const override { return "reference-generate"; }
  Json::Value execute(const Json::Value& payload, const ChunkSink& emit_chunk) override;
};

// Streams a 440 Hz tone, `chunk_ms` per chunk, length proportional to the text.
class SynthesizeBackend : public TaskBackend {
public:
  const char* name() const override { return "reference-synthesize"; }
  Json::Value execute(const Json::Value& payload, const ChunkSink& emit_chunk) override;
};

class CloneVoiceBackend : public TaskBackend {
public:
  const char* name() const override { return "reference-clone"; }
  Json::Value execute(const Json::Value& payload, const ChunkSink& emit_chunk) override;

private:
  struct Clone {
    std::string name;
    std::string mode;
    std::string status;
    int training_progress = 0;
    double quality_score = 0.0;
  };

  Json::Value create_from_audio(const Json::Value& payload, const std::string& mode, double min_seconds);
  Json::Value create_synthetic(const Json::Value& payload);
  Json::Value get_status(const Json::Value& payload);

  std::map<std::string, Clone> clones_;
};

} // namespace voxpipe
