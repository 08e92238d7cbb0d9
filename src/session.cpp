#include "session.hpp"
#include <exception>
#include <iostream>

namespace voxpipe {

const char* to_string(SessionState s) {
    switch (s) {
    case SessionState::Initializing: return "initializing";
    case SessionState::Listening: return "listening";
    case SessionState::Transcribing: return "transcribing";
    case SessionState::Generating: return "generating";
    case SessionState::Speaking: return "speaking";
    case SessionState::Paused: return "paused";
    case SessionState::Ended: return "ended";
    }
    return "unknown";
}

void ConversationContext::append(const std::string& role, const std::string& text) {
    turns_.push_back(ContextTurn{role, text});
    while (turns_.size() > max_turns_) turns_.pop_front();
}

void ConversationContext::assign(const std::vector<ContextTurn>& turns) {
    turns_.clear();
    for (const auto& t : turns) append(t.role, t.text);
}

Json::Value ConversationContext::window() const {
    Json::Value arr(Json::arrayValue);
    for (const auto& t : turns_) {
        Json::Value v;
        v["role"] = t.role;
        v["text"] = t.text;
        arr.append(v);
    }
    return arr;
}

bool InMemoryContextStore::load(const std::string& key, std::vector<ContextTurn>& out) {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = entries_.find(key);
    if (it == entries_.end()) return false;
    out = it->second;
    return true;
}

void InMemoryContextStore::save(const std::string& key, const std::deque<ContextTurn>& turns) {
    std::lock_guard<std::mutex> lk(mtx_);
    entries_[key] = std::vector<ContextTurn>(turns.begin(), turns.end());
}

Session::Session(std::string session_id, FrameSink frame_sink, const UtteranceConfig& ucfg, size_t max_context)
    : id(std::move(session_id)), sink(std::move(frame_sink)), detector(ucfg), context(max_context),
      created_at(Clock::now()), last_activity_at(created_at) {}

void Session::send(const Json::Value& frame) const {
    if (!sink) return;
    try {
        sink(frame);
    } catch (const std::exception& e) {
        std::cerr << "[SessionGateway] SINK_FAILED session=" << id << " err=" << e.what() << "\n";
    }
}

void Session::log_stage(const std::string& stage, bool ok, const std::string& output, const std::string& error) {
    StageResult r;
    r.stage = stage;
    r.turn = turn;
    r.start_ms = stage_started_wall_ms;
    r.end_ms = wall_clock_ms();
    r.ok = ok;
    r.output = output;
    r.error = error;
    stage_log.push_back(std::move(r));
}

Json::Value Session::stats_json() const {
    Json::Value v;
    v["duration_ms"] = static_cast<Json::Int64>(elapsed_ms(created_at, Clock::now()));
    v["turns"] = turn;
    v["turns_completed"] = turns_completed;
    v["turns_cancelled"] = turns_cancelled;
    v["errors"] = errors;
    v["audio_chunks"] = static_cast<Json::UInt64>(audio_chunks);
    v["dropped_audio_chunks"] = static_cast<Json::UInt64>(dropped_audio_chunks);
    v["avg_e2e_ms"] = e2e_count ? static_cast<double>(e2e_sum_ms) / e2e_count : 0.0;
    v["stages_logged"] = static_cast<Json::UInt64>(stage_log.size());
    return v;
}

} // namespace voxpipe
