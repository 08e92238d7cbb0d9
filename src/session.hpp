#pragma once
#include "include/voxpipe.hpp"
#include "stream_protocol.hpp"
#include "metrics_aggregator.hpp"
#include "core/audio/utterance_detector.h"
#include <json/json.h>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace voxpipe {

enum class SessionState : uint8_t {
    Initializing = 0,
    Listening,
    Transcribing,
    Generating,
    Speaking,
    Paused,
    Ended,
};

const char* to_string(SessionState s);

struct ContextTurn {
    std::string role;  // "user" | "assistant"
    std::string text;
};

// Ordered turn history, oldest dropped beyond max_turns.
class ConversationContext {
public:
    explicit ConversationContext(size_t max_turns = 20) : max_turns_(max_turns) {}

    void append(const std::string& role, const std::string& text);
    void assign(const std::vector<ContextTurn>& turns);
    Json::Value window() const;
    const std::deque<ContextTurn>& turns() const { return turns_; }
    size_t size() const { return turns_.size(); }

private:
    size_t max_turns_;
    std::deque<ContextTurn> turns_;
};

// Durable conversation context across reconnects. Optional: a gateway
// without a store starts every session with an empty context.
class ContextStore {
public:
    virtual ~ContextStore() = default;
    virtual bool load(const std::string& key, std::vector<ContextTurn>& out) = 0;
    virtual void save(const std::string& key, const std::deque<ContextTurn>& turns) = 0;
};

class InMemoryContextStore : public ContextStore {
public:
    bool load(const std::string& key, std::vector<ContextTurn>& out) override;
    void save(const std::string& key, const std::deque<ContextTurn>& turns) override;

private:
    std::mutex mtx_;
    std::map<std::string, std::vector<ContextTurn>> entries_;
};

// Immutable once appended to a session's stage log.
struct StageResult {
    std::string stage;
    int turn = 0;
    int64_t start_ms = 0;  // wall clock
    int64_t end_ms = 0;
    bool ok = false;
    std::string output;    // transcript, reply text, or audio summary
    std::string error;
};

using FrameSink = std::function<void(const Json::Value& frame)>;

// Per-connection pipeline state. Owned and mutated only by the gateway loop.
struct Session {
    Session(std::string session_id, FrameSink frame_sink, const UtteranceConfig& ucfg, size_t max_context);

    std::string id;
    SessionState state = SessionState::Initializing;
    SessionConfig config;
    FrameSink sink;
    UtteranceDetector detector;
    ConversationContext context;
    Clock::time_point created_at;
    Clock::time_point last_activity_at;

    // Current turn.
    int turn = 0;
    std::map<TaskType, std::string> active_tasks;  // at most one per stage
    Clock::time_point boundary_at{};
    Clock::time_point stage_started_at{};
    int64_t stage_started_wall_ms = 0;
    TurnRecord record;
    bool first_audio_sent = false;
    int tts_seq = 0;
    bool boundary_pending = false;

    std::vector<StageResult> stage_log;

    // Lifetime counters.
    int turns_completed = 0;
    int turns_cancelled = 0;
    int errors = 0;
    int protocol_errors = 0;
    uint64_t audio_chunks = 0;
    uint64_t dropped_audio_chunks = 0;
    int64_t last_audio_seq = -1;
    int64_t e2e_sum_ms = 0;
    int e2e_count = 0;

    bool turn_in_flight() const {
        return state == SessionState::Transcribing || state == SessionState::Generating ||
               state == SessionState::Speaking;
    }

    void send(const Json::Value& frame) const;
    void log_stage(const std::string& stage, bool ok, const std::string& output, const std::string& error);
    Json::Value stats_json() const;
};

} // namespace voxpipe
