#include "task_backend.h"
#include "reference_backends.h"
#include "silero_vad_backend.h"
#include "../audio/pcm.h"
#include "../codec/base64.h"

namespace voxpipe {

std::unique_ptr<TaskBackend> make_backend(TaskType type, const BackendOptions& opts) {
  switch (type) {
  case TaskType::Transcribe:
    return std::unique_ptr<TaskBackend>(new TranscribeBackend());
  case TaskType::Synthesize:
    return std::unique_ptr<TaskBackend>(new SynthesizeBackend());
  case TaskType::GenerateReply:
    return std::unique_ptr<TaskBackend>(new GenerateReplyBackend());
  case TaskType::CloneVoice:
    return std::unique_ptr<TaskBackend>(new CloneVoiceBackend());
  case TaskType::DetectVoiceActivity:
    return std::unique_ptr<TaskBackend>(new VoiceActivityBackend(opts.vad_model));
  }
  return nullptr;
}

std::string require_string(const Json::Value& payload, const char* key) {
  if (!payload.isObject() || !payload[key].isString()) {
    throw BackendError(ErrorKind::InvalidPayload, std::string("payload field '") + key + "' must be a string");
  }
  return payload[key].asString();
}

std::vector<int16_t> require_pcm(const Json::Value& payload, const char* key) {
  const std::string b64 = require_string(payload, key);
  std::vector<uint8_t> bytes;
  if (!base64_decode(b64, bytes)) {
    throw BackendError(ErrorKind::InvalidPayload, std::string("payload field '") + key + "' is not valid base64");
  }
  if (bytes.size() % 2 != 0) {
    throw BackendError(ErrorKind::InvalidPayload, std::string("payload field '") + key + "' is not PCM16");
  }
  return pcm16_from_bytes(bytes);
}

} // namespace voxpipe
