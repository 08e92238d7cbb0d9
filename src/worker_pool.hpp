#pragma once
#include "include/voxpipe.hpp"
#include "include/inbox.hpp"
#include "worker_process.hpp"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace voxpipe {

enum class SlotState : uint8_t {
    Starting = 0,
    Idle,
    Busy,
    Unhealthy,
    Terminating,
};

const char* to_string(SlotState s);

struct PoolConfig {
    TaskType type = TaskType::Transcribe;
    int workers = 2;
    std::string worker_bin;
    // Appended after "--type <type>" on the worker command line.
    std::vector<std::string> worker_args;
    int64_t health_interval_ms = 5000;
    int64_t ping_timeout_ms = 2000;
    int64_t startup_timeout_ms = 30000;
    int max_restarts = 3;
    int64_t restart_window_ms = 60000;
    // Applied to tasks submitted without a deadline; 0 disables.
    int64_t default_deadline_ms = 0;
};

// Snapshot published by the dispatch loop. `unhealthy` counts every slot
// that cannot take work (starting, down, terminating) so that
// idle + busy + unhealthy == total; `starting` and `terminating` break it down.
struct PoolStatus {
    TaskType type = TaskType::Transcribe;
    int total = 0;
    int idle = 0;
    int busy = 0;
    int unhealthy = 0;
    int starting = 0;
    int terminating = 0;
    int capacity = 0;      // slots not left down
    size_t queue_depth = 0;
    bool degraded = false;
    bool accepting = false;
    uint64_t submitted = 0;
    uint64_t completed = 0;
    uint64_t failed = 0;
    uint64_t restarts = 0;     // cumulative respawns over the pool lifetime
};

// Owns N worker processes of one task type. All slot and queue state is
// mutated only by the dispatch loop thread; callers post into its inbox.
class WorkerPool {
public:
    explicit WorkerPool(PoolConfig cfg);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void start();

    // on_done runs exactly once, on the dispatch thread (or on the calling
    // thread when the pool no longer accepts work).
    void submit(Task task, ResultCallback on_done, ChunkCallback on_chunk = nullptr);
    std::future<TaskResult> submit(Task task);

    // Queued: removed and resolved with Cancelled. In flight: resolved with
    // Cancelled now, the worker's eventual result is dropped.
    void cancel(const std::string& task_id);

    // Idempotent. Blocks until every worker process is gone; must not be
    // called from a result callback.
    void shutdown(int64_t grace_ms);

    PoolStatus describe() const;
    TaskType type() const { return cfg_.type; }

    // Blocks until `n` slots are idle or the timeout expires.
    bool wait_idle(int n, std::chrono::milliseconds timeout) const;

private:
    struct Pending {
        Task task;
        ResultCallback on_done;
        ChunkCallback on_chunk;
    };

    struct Slot {
        int index = 0;
        uint64_t generation = 0;
        SlotState state = SlotState::Starting;
        std::unique_ptr<WorkerProcess> proc;
        std::unique_ptr<Pending> current;
        Clock::time_point state_since{};
        Clock::time_point last_heartbeat{};
        bool ping_outstanding = false;
        int64_t ping_nonce = 0;
        Clock::time_point ping_sent{};
        // Crashes inside the restart window; older ones age out, which is
        // the slot's only restart accounting.
        std::deque<Clock::time_point> crashes;
        bool restart_pending = false;
        bool down = false;                      // left unhealthy for good
        bool shutdown_sent = false;
    };

    enum class EventKind : uint8_t { Submit, Cancel, WorkerLine, WorkerExited, Shutdown };

    struct Event {
        EventKind kind = EventKind::Submit;
        std::unique_ptr<Pending> pending;
        std::string task_id;
        int slot = -1;
        uint64_t generation = 0;
        std::string line;
        int exit_status = 0;
        int64_t grace_ms = 0;
    };

    void loop();
    void handle(Event& ev);
    void handle_submit(std::unique_ptr<Pending> p);
    void handle_cancel(const std::string& task_id);
    void handle_line(Slot& slot, const std::string& line);
    void handle_exit(Slot& slot, int status);
    void begin_shutdown(int64_t grace_ms);

    void spawn_slot(Slot& slot);
    void fail_slot(Slot& slot, ErrorKind kind, const std::string& reason);
    void finish_task(Slot& slot, const TaskResult& result);
    void send_shutdown(Slot& slot);

    void dispatch();
    void check_timers(Clock::time_point now);
    void restart_slots();
    void reject_all_queued(ErrorKind kind, const std::string& reason);
    void resolve(Pending& p, const TaskResult& result);
    bool has_live_slot() const;
    bool all_stopped() const;
    size_t queued() const;
    void publish_status();

    PoolConfig cfg_;
    Inbox<Event> inbox_;
    std::thread loop_;
    std::atomic<bool> accepting_{false};
    std::mutex lifecycle_mtx_;
    bool started_ = false;
    bool stopped_ = false;

    // Loop-owned state.
    std::vector<Slot> slots_;
    std::map<int, std::deque<std::unique_ptr<Pending>>, std::greater<int>> queue_;
    uint64_t next_generation_ = 0;
    int64_t next_nonce_ = 0;
    bool shutting_down_ = false;
    Clock::time_point shutdown_deadline_{};
    Clock::time_point last_health_{};
    uint64_t submitted_ = 0;
    uint64_t completed_ = 0;
    uint64_t failed_ = 0;
    uint64_t restarts_ = 0;

    mutable std::mutex status_mtx_;
    mutable std::condition_variable status_cv_;
    PoolStatus status_;
};

} // namespace voxpipe
