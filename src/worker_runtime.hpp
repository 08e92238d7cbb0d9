#pragma once
#include "include/voxpipe.hpp"
#include "worker_protocol.hpp"
#include "core/backends/task_backend.h"
#include <condition_variable>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace voxpipe {

struct WorkerOptions {
    TaskType type = TaskType::Transcribe;
    BackendOptions backend;
    // Honour "fault" / "delay_ms" in task payloads. Test builds only.
    bool allow_fault_injection = false;
    // none | mute (ignore pings after ready) | no-ready (never send ready)
    std::string fault_mode = "none";
};

// The worker side of the pool protocol. The reader (caller's thread)
// answers pings at once; a single executor thread runs one task at a time.
class WorkerRuntime {
public:
    WorkerRuntime(WorkerOptions opts, std::unique_ptr<TaskBackend> backend);
    ~WorkerRuntime();

    // Returns the process exit code: 0 after shutdown or end of input.
    int run(std::istream& in, std::ostream& out);

private:
    void executor_loop();
    // Runs one task and returns its terminal result or error message.
    WorkerMessage execute(const WorkerMessage& task);
    void emit(const WorkerMessage& msg);

    WorkerOptions opts_;
    std::unique_ptr<TaskBackend> backend_;
    std::ostream* out_ = nullptr;
    std::mutex out_mtx_;

    std::mutex mtx_;
    std::condition_variable cv_;
    std::unique_ptr<WorkerMessage> pending_;
    std::string running_id_;
    bool busy_ = false;
    bool stopping_ = false;
    std::thread executor_;
};

} // namespace voxpipe
