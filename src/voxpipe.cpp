#include "include/voxpipe.hpp"
#include <unistd.h>

namespace voxpipe {

namespace {

struct TypeName { TaskType type; const char* name; };
struct KindName { ErrorKind kind; const char* name; };

const TypeName kTypeNames[] = {
    {TaskType::Transcribe, "transcribe"},
    {TaskType::Synthesize, "synthesize"},
    {TaskType::GenerateReply, "generate-reply"},
    {TaskType::CloneVoice, "clone-voice"},
    {TaskType::DetectVoiceActivity, "detect-voice-activity"},
};

const KindName kKindNames[] = {
    {ErrorKind::WorkerCrashed, "WorkerCrashed"},
    {ErrorKind::QueueTimeout, "QueueTimeout"},
    {ErrorKind::ExecutionTimeout, "ExecutionTimeout"},
    {ErrorKind::UnknownTaskType, "UnknownTaskType"},
    {ErrorKind::PoolShuttingDown, "PoolShuttingDown"},
    {ErrorKind::SessionNotFound, "SessionNotFound"},
    {ErrorKind::InvalidState, "InvalidState"},
    {ErrorKind::TaskFailed, "TaskFailed"},
    {ErrorKind::InvalidPayload, "InvalidPayload"},
    {ErrorKind::WorkerBusy, "WorkerBusy"},
    {ErrorKind::ProtocolError, "ProtocolError"},
    {ErrorKind::Cancelled, "Cancelled"},
};

std::atomic<uint64_t> g_task_seq{0};

} // namespace

const char* to_string(TaskType t) {
    for (const auto& e : kTypeNames) {
        if (e.type == t) return e.name;
    }
    return "unknown";
}

const char* to_string(ErrorKind k) {
    for (const auto& e : kKindNames) {
        if (e.kind == k) return e.name;
    }
    return "TaskFailed";
}

bool parse_task_type(const std::string& s, TaskType& out) {
    for (const auto& e : kTypeNames) {
        if (s == e.name) { out = e.type; return true; }
    }
    return false;
}

bool parse_error_kind(const std::string& s, ErrorKind& out) {
    for (const auto& e : kKindNames) {
        if (s == e.name) { out = e.kind; return true; }
    }
    return false;
}

std::string make_task_id(const char* prefix) {
    uint64_t n = g_task_seq.fetch_add(1, std::memory_order_relaxed) + 1;
    return std::string(prefix) + "-" + std::to_string(::getpid()) + "-" + std::to_string(n);
}

int64_t elapsed_ms(Clock::time_point from, Clock::time_point to) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(to - from).count();
}

int64_t wall_clock_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace voxpipe
