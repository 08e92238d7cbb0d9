#include "stream_protocol.hpp"
#include "worker_protocol.hpp"
#include "core/codec/base64.h"

namespace voxpipe {

namespace {

struct FrameName { ClientFrameType type; const char* name; };

const FrameName kFrameNames[] = {
    {ClientFrameType::Init, "init"},
    {ClientFrameType::AudioChunk, "audio_chunk"},
    {ClientFrameType::TextInput, "text_input"},
    {ClientFrameType::Pause, "pause"},
    {ClientFrameType::Resume, "resume"},
    {ClientFrameType::Interrupt, "interrupt"},
    {ClientFrameType::End, "end"},
    {ClientFrameType::QualityFeedback, "quality_feedback"},
};

bool decode_config(const Json::Value& c, SessionConfig& cfg, std::string& err) {
    if (c.isNull()) return true;
    if (!c.isObject()) {
        err = "init config must be an object";
        return false;
    }
    cfg.mode = c.get("mode", cfg.mode).asString();
    if (cfg.mode != "voice" && cfg.mode != "text" && cfg.mode != "hybrid") {
        err = "unknown mode '" + cfg.mode + "'";
        return false;
    }
    cfg.tts_enabled = c.get("tts_enabled", cfg.mode != "text").asBool();
    cfg.voice = c.get("voice", cfg.voice).asString();
    cfg.language = c.get("language", cfg.language).asString();
    cfg.sample_rate = c.get("sample_rate", cfg.sample_rate).asInt();
    if (cfg.sample_rate < 8000 || cfg.sample_rate > 48000) {
        err = "sample_rate out of range";
        return false;
    }
    cfg.utterance_gap_ms = c.get("utterance_gap_ms", 0).asInt();
    cfg.context_id = c.get("context_id", "").asString();
    return true;
}

} // namespace

const char* to_string(ClientFrameType t) {
    for (const auto& f : kFrameNames) {
        if (f.type == t) return f.name;
    }
    return "unknown";
}

bool decode_client_frame(const std::string& line, ClientFrame& out, std::string& err) {
    Json::Value v;
    if (!parse_json_line(line, v, err)) return false;
    return decode_client_frame(v, out, err);
}

bool decode_client_frame(const Json::Value& v, ClientFrame& out, std::string& err) {
    if (!v.isObject() || !v["type"].isString()) {
        err = "frame has no type";
        return false;
    }
    const std::string type = v["type"].asString();
    bool known = false;
    for (const auto& f : kFrameNames) {
        if (type == f.name) { out.type = f.type; known = true; break; }
    }
    if (!known) {
        err = "unknown frame type '" + type + "'";
        return false;
    }
    out.session_id = v.get("session_id", "").asString();

    try {
        switch (out.type) {
        case ClientFrameType::Init:
            return decode_config(v["config"], out.config, err);
        case ClientFrameType::AudioChunk:
            if (!v["audio"].isString() || !base64_decode(v["audio"].asString(), out.audio)) {
                err = "audio_chunk needs base64 'audio'";
                return false;
            }
            if (out.audio.size() % 2 != 0) {
                err = "audio_chunk is not PCM16";
                return false;
            }
            out.seq = v.get("seq", 0).asInt64();
            out.end_of_turn = v.get("end_of_turn", false).asBool();
            return true;
        case ClientFrameType::TextInput:
            if (!v["text"].isString()) {
                err = "text_input needs 'text'";
                return false;
            }
            out.text = v["text"].asString();
            return true;
        case ClientFrameType::QualityFeedback:
            if (!v["score"].isNumeric()) {
                err = "quality_feedback needs numeric 'score'";
                return false;
            }
            out.score = v["score"].asDouble();
            out.category = v.get("category", "").asString();
            out.text = v.get("comment", "").asString();
            return true;
        case ClientFrameType::Pause:
        case ClientFrameType::Resume:
        case ClientFrameType::Interrupt:
        case ClientFrameType::End:
            return true;
        }
    } catch (const Json::LogicError& e) {
        // wrong field types, e.g. a string where a number belongs
        err = std::string("bad field type: ") + e.what();
        return false;
    }
    return true;
}

Json::Value make_server_frame(const char* type, const std::string& session_id, int turn) {
    Json::Value v(Json::objectValue);
    v["type"] = type;
    v["session_id"] = session_id;
    v["ts"] = static_cast<Json::Int64>(wall_clock_ms());
    if (turn > 0) v["turn"] = turn;
    return v;
}

Json::Value make_error_frame(const std::string& session_id, ErrorKind kind, const std::string& message,
                             const std::string& stage, int turn) {
    Json::Value v = make_server_frame("error", session_id, turn);
    v["kind"] = to_string(kind);
    v["message"] = message;
    if (!stage.empty()) v["stage"] = stage;
    return v;
}

std::string encode_frame(const Json::Value& frame) {
    return to_json_line(frame);
}

} // namespace voxpipe
