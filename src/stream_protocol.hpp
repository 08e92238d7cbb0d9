#pragma once
#include "include/voxpipe.hpp"
#include <json/json.h>
#include <cstdint>
#include <string>
#include <vector>

namespace voxpipe {

// Client <-> gateway frames: one JSON object per line, tagged by "type".
enum class ClientFrameType : uint8_t {
    Init = 0,
    AudioChunk,
    TextInput,
    Pause,
    Resume,
    Interrupt,
    End,
    QualityFeedback,
};

const char* to_string(ClientFrameType t);

struct SessionConfig {
    std::string mode = "voice";      // voice | text | hybrid
    bool tts_enabled = true;
    std::string voice = "default";
    std::string language = "en";
    int sample_rate = 16000;
    int utterance_gap_ms = 0;        // 0 keeps the gateway default
    std::string context_id;          // key for the context store
};

struct ClientFrame {
    ClientFrameType type = ClientFrameType::Pause;
    std::string session_id;          // optional on a dedicated connection
    SessionConfig config;            // init
    std::vector<uint8_t> audio;      // audio_chunk, PCM16LE mono
    int64_t seq = 0;
    bool end_of_turn = false;
    std::string text;                // text_input, quality_feedback comment
    double score = 0.0;              // quality_feedback
    std::string category;
};

bool decode_client_frame(const std::string& line, ClientFrame& out, std::string& err);
bool decode_client_frame(const Json::Value& v, ClientFrame& out, std::string& err);

// Server frame skeleton: {"type", "session_id", "ts"[, "turn"]}.
Json::Value make_server_frame(const char* type, const std::string& session_id, int turn = 0);
Json::Value make_error_frame(const std::string& session_id, ErrorKind kind, const std::string& message,
                             const std::string& stage = std::string(), int turn = 0);

std::string encode_frame(const Json::Value& frame);

} // namespace voxpipe
