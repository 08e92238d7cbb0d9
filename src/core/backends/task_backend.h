#pragma once
#include "../../include/voxpipe.hpp"
#include <json/json.h>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace voxpipe {

// Thrown by a backend to report a typed failure; anything else a backend
// throws is reported as TaskFailed.
class BackendError : public std::runtime_error {
public:
  BackendError(ErrorKind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {}
  ErrorKind kind() const { return kind_; }

private:
  ErrorKind kind_;
};

struct BackendOptions {
  std::string vad_model;  // Silero VAD ONNX file, empty for the energy fallback
};

// Executes tasks of one type inside a worker process. One task at a time.
class TaskBackend {
public:
  using ChunkSink = std::function<void(Json::Value chunk)>;

  virtual ~TaskBackend() = default;
  virtual const char* name() const = 0;
  // Expensive one-time setup; throws on failure.
  virtual void load() {}
  virtual Json::Value execute(const Json::Value& payload, const ChunkSink& emit_chunk) = 0;
};

std::unique_ptr<TaskBackend> make_backend(TaskType type, const BackendOptions& opts);

// Payload helpers shared by backends.
std::string require_string(const Json::Value& payload, const char* key);
std::vector<int16_t> require_pcm(const Json::Value& payload, const char* key);

} // namespace voxpipe
