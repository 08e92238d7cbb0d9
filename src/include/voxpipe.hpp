#pragma once
#include <json/json.h>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace voxpipe {

using Clock = std::chrono::steady_clock;

// Closed set of task types; one pool per variant.
enum class TaskType : uint8_t {
    Transcribe = 0,
    Synthesize,
    GenerateReply,
    CloneVoice,
    DetectVoiceActivity,
};

constexpr int kTaskTypeCount = 5;

// Higher value is dispatched first.
enum class TaskPriority : int {
    Batch = 0,
    Normal = 1,
    Interactive = 2,
};

enum class ErrorKind : uint8_t {
    WorkerCrashed = 0,
    QueueTimeout,
    ExecutionTimeout,
    UnknownTaskType,
    PoolShuttingDown,
    SessionNotFound,
    InvalidState,
    TaskFailed,
    InvalidPayload,
    WorkerBusy,
    ProtocolError,
    Cancelled,
};

struct TaskError {
    ErrorKind kind = ErrorKind::TaskFailed;
    std::string message;
};

struct Task {
    std::string id;
    TaskType type = TaskType::Transcribe;
    Json::Value payload;
    int priority = static_cast<int>(TaskPriority::Normal);
    Clock::time_point submitted_at{};
    // 0 means no deadline
    int64_t deadline_ms = 0;
};

struct TaskResult {
    std::string id;
    bool ok = false;
    Json::Value payload;
    TaskError error;

    static TaskResult success(const std::string& id, Json::Value payload) {
        TaskResult r;
        r.id = id;
        r.ok = true;
        r.payload = std::move(payload);
        return r;
    }

    static TaskResult failure(const std::string& id, ErrorKind kind, std::string message) {
        TaskResult r;
        r.id = id;
        r.ok = false;
        r.error.kind = kind;
        r.error.message = std::move(message);
        return r;
    }
};

using ResultCallback = std::function<void(const TaskResult&)>;
// Partial output streamed by a worker before the terminal result.
using ChunkCallback = std::function<void(const std::string& task_id, int seq, const Json::Value& payload)>;

const char* to_string(TaskType t);
const char* to_string(ErrorKind k);
bool parse_task_type(const std::string& s, TaskType& out);
bool parse_error_kind(const std::string& s, ErrorKind& out);

// Unique per process: "<prefix>-<pid>-<counter>"
std::string make_task_id(const char* prefix);

int64_t elapsed_ms(Clock::time_point from, Clock::time_point to);
int64_t wall_clock_ms();

} // namespace voxpipe
