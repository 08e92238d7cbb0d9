#pragma once
#include "include/voxpipe.hpp"
#include "include/inbox.hpp"
#include "session.hpp"
#include "stream_protocol.hpp"
#include "task_router.hpp"
#include "metrics_aggregator.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <unordered_map>

namespace voxpipe {

struct GatewayConfig {
    int64_t idle_timeout_ms = 300000;
    size_t max_context_turns = 20;
    UtteranceConfig utterance;
    int64_t task_deadline_ms = 30000;
    int tts_chunk_ms = 200;
    // A session that sends this many undecodable frames is closed.
    int max_protocol_errors = 5;
};

struct GatewayStats {
    size_t active_sessions = 0;
    uint64_t opened = 0;
    uint64_t closed = 0;
    uint64_t turns_started = 0;
    uint64_t turns_completed = 0;
    uint64_t turns_cancelled = 0;
    uint64_t turns_failed = 0;
};

// Owns every live Session and drives its pipeline
// (transcribe -> generate-reply -> synthesize). A single loop thread owns
// the session table; transports and task callbacks post into its inbox.
//
// Frames are delivered to each session's sink on the loop thread. The
// router must stop invoking callbacks (or the gateway must be stopped)
// before the gateway is destroyed.
class SessionGateway {
public:
    SessionGateway(TaskRouter& router, MetricsAggregator& metrics, GatewayConfig cfg,
                   ContextStore* store = nullptr);
    ~SessionGateway();

    SessionGateway(const SessionGateway&) = delete;
    SessionGateway& operator=(const SessionGateway&) = delete;

    void start();
    // Ends every session with reason "server_shutdown" and joins the loop.
    void stop();

    std::string open_session(FrameSink sink);
    // False when the session does not exist (SessionNotFound).
    bool on_frame(const std::string& session_id, ClientFrame frame);
    bool on_raw_frame(const std::string& session_id, const std::string& line);
    // Transport went away: tear down without sending anything.
    void close_session(const std::string& session_id);

    bool has_session(const std::string& session_id) const;
    GatewayStats stats() const;

private:
    enum class EventKind : uint8_t { Open, Frame, RawFrame, Close, StageChunk, StageDone, Stop };

    struct Event {
        EventKind kind = EventKind::Frame;
        std::string session_id;
        FrameSink sink;
        ClientFrame frame;
        std::string line;
        int turn = 0;
        TaskType stage = TaskType::Transcribe;
        int seq = 0;
        Json::Value payload;
        TaskResult result;
    };

    void loop();
    void handle(Event& ev);
    void handle_frame(Session& s, const ClientFrame& f);
    void handle_raw(Session& s, const std::string& line);
    void handle_stage_chunk(Session& s, const Event& ev);
    void handle_stage_done(Session& s, const Event& ev);

    void on_init(Session& s, const ClientFrame& f);
    void on_audio(Session& s, const ClientFrame& f);
    void on_text(Session& s, const ClientFrame& f);
    void on_pause(Session& s);
    void on_resume(Session& s);

    void begin_audio_turn(Session& s);
    void begin_turn(Session& s, Json::Value transcribe_payload);
    void submit_stage(Session& s, TaskType stage, Json::Value payload);
    void complete_turn(Session& s);
    void fail_turn(Session& s, TaskType stage, const TaskError& error);
    void cancel_turn(Session& s, const char* reason);
    void end_session(Session& s, const char* reason, bool notify);
    void sweep_idle(Clock::time_point now);
    void send_error(Session& s, ErrorKind kind, const std::string& message, const std::string& stage = "");
    void set_state(Session& s, SessionState next);
    void publish_stats();

    TaskRouter& router_;
    MetricsAggregator& metrics_;
    GatewayConfig cfg_;
    ContextStore* store_;

    Inbox<Event> inbox_;
    std::thread loop_;
    std::mutex lifecycle_mtx_;
    bool started_ = false;
    bool stopped_ = false;

    // Loop-owned.
    std::unordered_map<std::string, std::unique_ptr<Session>> sessions_;
    GatewayStats counters_;

    mutable std::mutex known_mtx_;
    std::set<std::string> known_ids_;
    mutable std::mutex stats_mtx_;
    GatewayStats stats_;
};

const char* stage_name(TaskType stage);

} // namespace voxpipe
