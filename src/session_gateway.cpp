#include "session_gateway.hpp"
#include "core/audio/pcm.h"
#include "core/codec/base64.h"
#include <iostream>

using namespace std::chrono_literals;

namespace voxpipe {

const char* stage_name(TaskType stage) {
    switch (stage) {
    case TaskType::Transcribe: return "stt";
    case TaskType::GenerateReply: return "generate";
    case TaskType::Synthesize: return "tts";
    default: return to_string(stage);
    }
}

SessionGateway::SessionGateway(TaskRouter& router, MetricsAggregator& metrics, GatewayConfig cfg,
                               ContextStore* store)
    : router_(router), metrics_(metrics), cfg_(std::move(cfg)), store_(store) {}

SessionGateway::~SessionGateway() {
    stop();
}

void SessionGateway::start() {
    std::lock_guard<std::mutex> lk(lifecycle_mtx_);
    if (started_ || stopped_) return;
    started_ = true;
    loop_ = std::thread(&SessionGateway::loop, this);
}

void SessionGateway::stop() {
    std::lock_guard<std::mutex> lk(lifecycle_mtx_);
    if (stopped_) return;
    stopped_ = true;
    if (!started_) return;
    Event ev;
    ev.kind = EventKind::Stop;
    inbox_.post(std::move(ev));
    if (loop_.joinable()) loop_.join();
}

std::string SessionGateway::open_session(FrameSink sink) {
    std::string id = make_task_id("sess");
    {
        std::lock_guard<std::mutex> lk(known_mtx_);
        known_ids_.insert(id);
    }
    Event ev;
    ev.kind = EventKind::Open;
    ev.session_id = id;
    ev.sink = std::move(sink);
    if (!inbox_.post(std::move(ev))) {
        std::lock_guard<std::mutex> lk(known_mtx_);
        known_ids_.erase(id);
        return std::string();
    }
    return id;
}

bool SessionGateway::has_session(const std::string& session_id) const {
    std::lock_guard<std::mutex> lk(known_mtx_);
    return known_ids_.count(session_id) != 0;
}

bool SessionGateway::on_frame(const std::string& session_id, ClientFrame frame) {
    if (!has_session(session_id)) return false;
    Event ev;
    ev.kind = EventKind::Frame;
    ev.session_id = session_id;
    ev.frame = std::move(frame);
    return inbox_.post(std::move(ev));
}

bool SessionGateway::on_raw_frame(const std::string& session_id, const std::string& line) {
    if (!has_session(session_id)) return false;
    Event ev;
    ev.kind = EventKind::RawFrame;
    ev.session_id = session_id;
    ev.line = line;
    return inbox_.post(std::move(ev));
}

void SessionGateway::close_session(const std::string& session_id) {
    Event ev;
    ev.kind = EventKind::Close;
    ev.session_id = session_id;
    inbox_.post(std::move(ev));
}

GatewayStats SessionGateway::stats() const {
    std::lock_guard<std::mutex> lk(stats_mtx_);
    return stats_;
}

void SessionGateway::loop() {
    bool running = true;
    while (running) {
        auto events = inbox_.drain(50ms);
        for (auto& ev : events) {
            if (ev.kind == EventKind::Stop) {
                running = false;
                continue;
            }
            handle(ev);
        }
        sweep_idle(Clock::now());
        publish_stats();
    }

    inbox_.close();
    std::vector<Session*> live;
    for (auto& kv : sessions_) live.push_back(kv.second.get());
    for (Session* s : live) end_session(*s, "server_shutdown", true);
    publish_stats();
    std::cout << "[SessionGateway] STOPPED opened=" << counters_.opened << " turns=" << counters_.turns_completed << "\n";
}

void SessionGateway::handle(Event& ev) {
    if (ev.kind == EventKind::Open) {
        std::unique_ptr<Session> s(new Session(ev.session_id, std::move(ev.sink), cfg_.utterance,
                                               cfg_.max_context_turns));
        std::cout << "[SessionGateway] SESSION_OPENED session=" << s->id << "\n";
        sessions_[ev.session_id] = std::move(s);
        ++counters_.opened;
        return;
    }

    auto it = sessions_.find(ev.session_id);
    if (it == sessions_.end()) {
        if (ev.kind == EventKind::StageDone) {
            std::cout << "[SessionGateway] RESULT_FOR_CLOSED_SESSION session=" << ev.session_id
                      << " task=" << ev.result.id << "\n";
        }
        return;
    }
    Session& s = *it->second;

    switch (ev.kind) {
    case EventKind::Frame:
        s.last_activity_at = Clock::now();
        handle_frame(s, ev.frame);
        break;
    case EventKind::RawFrame:
        s.last_activity_at = Clock::now();
        handle_raw(s, ev.line);
        break;
    case EventKind::Close:
        end_session(s, "disconnected", false);
        break;
    case EventKind::StageChunk:
        handle_stage_chunk(s, ev);
        break;
    case EventKind::StageDone:
        handle_stage_done(s, ev);
        break;
    case EventKind::Open:
    case EventKind::Stop:
        break;
    }
}

void SessionGateway::handle_raw(Session& s, const std::string& line) {
    ClientFrame f;
    std::string err;
    if (!decode_client_frame(line, f, err)) {
        ++s.protocol_errors;
        send_error(s, ErrorKind::ProtocolError, err);
        if (s.protocol_errors >= cfg_.max_protocol_errors) {
            end_session(s, "protocol_violation", true);
        }
        return;
    }
    handle_frame(s, f);
}

void SessionGateway::handle_frame(Session& s, const ClientFrame& f) {
    if (!f.session_id.empty() && f.session_id != s.id) {
        send_error(s, ErrorKind::SessionNotFound, "unknown session " + f.session_id);
        return;
    }
    if (s.state == SessionState::Initializing && f.type != ClientFrameType::Init &&
        f.type != ClientFrameType::End) {
        send_error(s, ErrorKind::InvalidState, std::string(to_string(f.type)) + " before init");
        return;
    }

    switch (f.type) {
    case ClientFrameType::Init:
        on_init(s, f);
        break;
    case ClientFrameType::AudioChunk:
        on_audio(s, f);
        break;
    case ClientFrameType::TextInput:
        on_text(s, f);
        break;
    case ClientFrameType::Pause:
        on_pause(s);
        break;
    case ClientFrameType::Resume:
        on_resume(s);
        break;
    case ClientFrameType::Interrupt:
        if (s.turn_in_flight()) cancel_turn(s, "interrupted");
        break;
    case ClientFrameType::End:
        end_session(s, "client_requested", true);
        break;
    case ClientFrameType::QualityFeedback:
        metrics_.record_feedback(s.id, f.score, f.category);
        break;
    }
}

void SessionGateway::on_init(Session& s, const ClientFrame& f) {
    if (s.state != SessionState::Initializing) {
        send_error(s, ErrorKind::InvalidState, "session already initialised");
        return;
    }
    s.config = f.config;
    UtteranceConfig ucfg = cfg_.utterance;
    ucfg.sample_rate = s.config.sample_rate;
    if (s.config.utterance_gap_ms > 0) ucfg.gap_ms = s.config.utterance_gap_ms;
    s.detector.reconfigure(ucfg);

    bool restored = false;
    if (store_ && !s.config.context_id.empty()) {
        std::vector<ContextTurn> turns;
        if (store_->load(s.config.context_id, turns)) {
            s.context.assign(turns);
            restored = true;
        }
    }
    set_state(s, SessionState::Listening);

    Json::Value ready = make_server_frame("ready", s.id);
    ready["mode"] = s.config.mode;
    ready["tts_enabled"] = s.config.tts_enabled;
    ready["sample_rate"] = s.config.sample_rate;
    ready["context_turns"] = static_cast<Json::UInt64>(s.context.size());
    ready["context_restored"] = restored;
    s.send(ready);
}

void SessionGateway::on_audio(Session& s, const ClientFrame& f) {
    if (s.state == SessionState::Paused) {
        ++s.dropped_audio_chunks;
        std::cout << "[SessionGateway] AUDIO_DROPPED_PAUSED session=" << s.id << " seq=" << f.seq << "\n";
        return;
    }
    ++s.audio_chunks;
    if (s.last_audio_seq >= 0 && f.seq != s.last_audio_seq + 1) {
        std::cout << "[SessionGateway] AUDIO_SEQ_GAP session=" << s.id << " expected=" << s.last_audio_seq + 1
                  << " got=" << f.seq << "\n";
    }
    s.last_audio_seq = f.seq;

    bool boundary = s.detector.push(pcm16_from_bytes(f.audio));
    if (f.end_of_turn && s.detector.force_boundary()) boundary = true;
    if (!boundary) return;

    if (s.state == SessionState::Listening) {
        begin_audio_turn(s);
    } else {
        // Picked up once the current turn finishes.
        s.boundary_pending = true;
    }
}

void SessionGateway::on_text(Session& s, const ClientFrame& f) {
    if (s.state == SessionState::Paused) {
        send_error(s, ErrorKind::InvalidState, "session is paused");
        return;
    }
    if (s.turn_in_flight()) {
        send_error(s, ErrorKind::InvalidState, "turn " + std::to_string(s.turn) + " is still in progress");
        return;
    }
    if (f.text.empty()) {
        send_error(s, ErrorKind::ProtocolError, "empty text_input");
        return;
    }
    Json::Value payload;
    payload["text"] = f.text;
    payload["language"] = s.config.language;
    begin_turn(s, payload);
}

void SessionGateway::on_pause(Session& s) {
    if (s.turn_in_flight()) {
        cancel_turn(s, "paused");
        return;
    }
    if (s.state == SessionState::Paused) {
        send_error(s, ErrorKind::InvalidState, "session is already paused");
        return;
    }
    set_state(s, SessionState::Paused);
}

void SessionGateway::on_resume(Session& s) {
    if (s.state != SessionState::Paused) {
        send_error(s, ErrorKind::InvalidState, std::string("resume while ") + to_string(s.state));
        return;
    }
    set_state(s, SessionState::Listening);
}

void SessionGateway::begin_audio_turn(Session& s) {
    s.boundary_pending = false;
    std::vector<int16_t> pcm = s.detector.take();
    Json::Value payload;
    payload["audio"] = base64_encode(pcm16_to_bytes(pcm));
    payload["sample_rate"] = s.config.sample_rate;
    payload["language"] = s.config.language;
    begin_turn(s, payload);
}

void SessionGateway::begin_turn(Session& s, Json::Value transcribe_payload) {
    ++s.turn;
    ++counters_.turns_started;
    s.boundary_at = Clock::now();
    s.record = TurnRecord();
    s.record.session_id = s.id;
    s.record.turn = s.turn;
    s.record.started_at_ms = wall_clock_ms();
    s.first_audio_sent = false;
    s.tts_seq = 0;
    std::cout << "[SessionGateway] TURN_STARTED session=" << s.id << " turn=" << s.turn << "\n";
    set_state(s, SessionState::Transcribing);
    submit_stage(s, TaskType::Transcribe, std::move(transcribe_payload));
}

void SessionGateway::submit_stage(Session& s, TaskType stage, Json::Value payload) {
    Task t;
    t.id = make_task_id(stage_name(stage));
    t.type = stage;
    t.payload = std::move(payload);
    t.priority = static_cast<int>(TaskPriority::Interactive);
    t.submitted_at = Clock::now();
    t.deadline_ms = cfg_.task_deadline_ms;

    s.active_tasks[stage] = t.id;
    s.stage_started_at = t.submitted_at;
    s.stage_started_wall_ms = wall_clock_ms();

    const std::string sid = s.id;
    const int turn = s.turn;
    router_.route(
        std::move(t),
        [this, sid, turn, stage](const TaskResult& r) {
            Event ev;
            ev.kind = EventKind::StageDone;
            ev.session_id = sid;
            ev.turn = turn;
            ev.stage = stage;
            ev.result = r;
            inbox_.post(std::move(ev));
        },
        [this, sid, turn, stage](const std::string& task_id, int seq, const Json::Value& payload) {
            Event ev;
            ev.kind = EventKind::StageChunk;
            ev.session_id = sid;
            ev.turn = turn;
            ev.stage = stage;
            ev.seq = seq;
            ev.payload = payload;
            ev.result.id = task_id;
            inbox_.post(std::move(ev));
        });
}

void SessionGateway::handle_stage_chunk(Session& s, const Event& ev) {
    auto active = s.active_tasks.find(ev.stage);
    if (ev.turn != s.turn || active == s.active_tasks.end() || active->second != ev.result.id) return;

    if (ev.stage == TaskType::Transcribe) {
        Json::Value f = make_server_frame("stt_partial", s.id, s.turn);
        f["text"] = ev.payload.get("text", "").asString();
        s.send(f);
    } else if (ev.stage == TaskType::Synthesize) {
        if (!s.first_audio_sent) {
            s.first_audio_sent = true;
            s.record.e2e_ms = elapsed_ms(s.boundary_at, Clock::now());
        }
        Json::Value f = make_server_frame("tts_chunk", s.id, s.turn);
        f["audio"] = ev.payload.get("audio", "").asString();
        f["seq"] = s.tts_seq++;
        f["sample_rate"] = ev.payload.get("sample_rate", s.config.sample_rate).asInt();
        s.send(f);
    }
}

void SessionGateway::handle_stage_done(Session& s, const Event& ev) {
    auto active = s.active_tasks.find(ev.stage);
    if (ev.turn != s.turn || active == s.active_tasks.end() || active->second != ev.result.id) {
        std::cout << "[SessionGateway] STALE_RESULT_DISCARDED session=" << s.id << " turn=" << ev.turn
                  << " stage=" << stage_name(ev.stage) << " task=" << ev.result.id << "\n";
        return;
    }
    s.active_tasks.erase(active);
    const auto now = Clock::now();
    const int64_t stage_ms = elapsed_ms(s.stage_started_at, now);
    const TaskResult& r = ev.result;

    if (!r.ok) {
        s.log_stage(stage_name(ev.stage), false, "", r.error.message);
        fail_turn(s, ev.stage, r.error);
        return;
    }

    switch (ev.stage) {
    case TaskType::Transcribe: {
        const std::string text = r.payload.get("text", "").asString();
        s.record.stt_ms = stage_ms;
        s.log_stage("stt", true, text, "");
        Json::Value f = make_server_frame("stt_final", s.id, s.turn);
        f["text"] = text;
        f["confidence"] = r.payload.get("confidence", 0.0).asDouble();
        f["language"] = r.payload.get("language", s.config.language).asString();
        f["latency_ms"] = static_cast<Json::Int64>(stage_ms);
        s.send(f);
        if (text.empty()) {
            complete_turn(s);
            return;
        }
        s.context.append("user", text);
        set_state(s, SessionState::Generating);
        s.send(make_server_frame("agent_thinking", s.id, s.turn));
        Json::Value payload;
        payload["context"] = s.context.window();
        payload["language"] = s.config.language;
        payload["session_id"] = s.id;
        submit_stage(s, TaskType::GenerateReply, payload);
        return;
    }
    case TaskType::GenerateReply: {
        const std::string reply = r.payload.get("text", "").asString();
        s.record.generate_ms = stage_ms;
        s.log_stage("generate", true, reply, "");
        s.context.append("assistant", reply);
        Json::Value f = make_server_frame("agent_reply", s.id, s.turn);
        f["text"] = reply;
        f["latency_ms"] = static_cast<Json::Int64>(stage_ms);
        s.send(f);
        if (!s.config.tts_enabled || reply.empty()) {
            s.record.e2e_ms = elapsed_ms(s.boundary_at, now);
            complete_turn(s);
            return;
        }
        set_state(s, SessionState::Speaking);
        Json::Value payload;
        payload["text"] = reply;
        payload["voice"] = s.config.voice;
        payload["sample_rate"] = s.config.sample_rate;
        payload["chunk_ms"] = cfg_.tts_chunk_ms;
        submit_stage(s, TaskType::Synthesize, payload);
        return;
    }
    case TaskType::Synthesize: {
        s.record.tts_ms = stage_ms;
        if (!s.first_audio_sent) s.record.e2e_ms = elapsed_ms(s.boundary_at, now);
        s.log_stage("tts", true, std::to_string(s.tts_seq) + " chunks", "");
        Json::Value f = make_server_frame("tts_complete", s.id, s.turn);
        f["chunks"] = s.tts_seq;
        f["duration_ms"] = r.payload.get("duration_ms", Json::Int64(0)).asInt64();
        f["latency_ms"] = static_cast<Json::Int64>(stage_ms);
        s.send(f);
        complete_turn(s);
        return;
    }
    default:
        std::cerr << "[SessionGateway] UNEXPECTED_STAGE session=" << s.id << " stage=" << to_string(ev.stage) << "\n";
        return;
    }
}

void SessionGateway::complete_turn(Session& s) {
    s.record.completed = true;
    metrics_.record(s.record);
    ++s.turns_completed;
    ++counters_.turns_completed;
    if (s.record.e2e_ms >= 0) {
        s.e2e_sum_ms += s.record.e2e_ms;
        ++s.e2e_count;
    }

    Json::Value m = make_server_frame("metrics", s.id, s.turn);
    m["stt_ms"] = static_cast<Json::Int64>(s.record.stt_ms);
    m["generate_ms"] = static_cast<Json::Int64>(s.record.generate_ms);
    m["tts_ms"] = static_cast<Json::Int64>(s.record.tts_ms);
    m["e2e_ms"] = static_cast<Json::Int64>(s.record.e2e_ms);
    m["active_sessions"] = static_cast<Json::UInt64>(sessions_.size());
    std::cout << "[SessionGateway] TURN_COMPLETED session=" << s.id << " turn=" << s.turn
              << " e2e_ms=" << s.record.e2e_ms << "\n";

    set_state(s, SessionState::Listening);
    s.send(m);
    if (s.boundary_pending) begin_audio_turn(s);
}

void SessionGateway::fail_turn(Session& s, TaskType stage, const TaskError& error) {
    std::cout << "[SessionGateway] STAGE_FAILED session=" << s.id << " turn=" << s.turn
              << " stage=" << stage_name(stage) << " kind=" << to_string(error.kind) << "\n";
    for (const auto& kv : s.active_tasks) router_.cancel(kv.first, kv.second);
    s.active_tasks.clear();
    s.record.failed = true;
    s.record.failed_stage = stage_name(stage);
    metrics_.record(s.record);
    ++s.errors;
    ++counters_.turns_failed;

    set_state(s, SessionState::Listening);
    send_error(s, error.kind, error.message, stage_name(stage));
    if (s.boundary_pending) begin_audio_turn(s);
}

void SessionGateway::cancel_turn(Session& s, const char* reason) {
    for (const auto& kv : s.active_tasks) router_.cancel(kv.first, kv.second);
    s.active_tasks.clear();
    s.record.cancelled = true;
    metrics_.record(s.record);
    ++s.turns_cancelled;
    ++counters_.turns_cancelled;
    s.boundary_pending = false;
    std::cout << "[SessionGateway] TURN_CANCELLED session=" << s.id << " turn=" << s.turn
              << " reason=" << reason << " state=" << to_string(s.state) << "\n";
    set_state(s, SessionState::Listening);
}

void SessionGateway::end_session(Session& s, const char* reason, bool notify) {
    if (s.turn_in_flight()) cancel_turn(s, reason);
    if (store_ && !s.config.context_id.empty()) store_->save(s.config.context_id, s.context.turns());
    set_state(s, SessionState::Ended);
    {
        std::lock_guard<std::mutex> lk(known_mtx_);
        known_ids_.erase(s.id);
    }

    if (notify) {
        Json::Value f = make_server_frame("ended", s.id);
        f["reason"] = reason;
        f["stats"] = s.stats_json();
        s.send(f);
    }
    std::cout << "[SessionGateway] SESSION_ENDED session=" << s.id << " reason=" << reason
              << " turns=" << s.turn << " errors=" << s.errors << "\n";

    ++counters_.closed;
    std::string id = s.id;
    sessions_.erase(id);
}

void SessionGateway::sweep_idle(Clock::time_point now) {
    std::vector<Session*> idle;
    for (auto& kv : sessions_) {
        Session& s = *kv.second;
        if (s.turn_in_flight()) continue;
        if (elapsed_ms(s.last_activity_at, now) >= cfg_.idle_timeout_ms) idle.push_back(&s);
    }
    for (Session* s : idle) end_session(*s, "idle_timeout", true);
}

void SessionGateway::send_error(Session& s, ErrorKind kind, const std::string& message, const std::string& stage) {
    s.send(make_error_frame(s.id, kind, message, stage, s.turn_in_flight() || !stage.empty() ? s.turn : 0));
}

void SessionGateway::set_state(Session& s, SessionState next) {
    if (s.state == next) return;
    s.state = next;
}

void SessionGateway::publish_stats() {
    GatewayStats st = counters_;
    st.active_sessions = sessions_.size();
    std::lock_guard<std::mutex> lk(stats_mtx_);
    stats_ = st;
}

} // namespace voxpipe
