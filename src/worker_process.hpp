#pragma once
#include <sys/types.h>
#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace voxpipe {

// One child process wired to the parent through its stdin/stdout pipes.
// stderr is inherited so worker logs land in the service log.
class WorkerProcess {
public:
    using LineHandler = std::function<void(const std::string& line)>;
    // Called once from the reader thread after the child has been reaped.
    using ExitHandler = std::function<void(int exit_status)>;

    WorkerProcess() = default;
    ~WorkerProcess();

    WorkerProcess(const WorkerProcess&) = delete;
    WorkerProcess& operator=(const WorkerProcess&) = delete;

    bool spawn(const std::vector<std::string>& argv, LineHandler on_line, ExitHandler on_exit,
               std::string& err);

    // Appends '\n'. Returns false if the pipe is closed.
    bool send_line(const std::string& line);
    void close_stdin();

    // Signal delivery is a no-op once the child has been reaped, so calling
    // these repeatedly never hits a recycled pid.
    void terminate();
    void kill_now();

    pid_t pid() const { return pid_; }
    bool exited() const { return reaped_.load(std::memory_order_acquire); }

private:
    void reader_loop();
    void signal_child(int sig);

    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    LineHandler on_line_;
    ExitHandler on_exit_;
    std::thread reader_;
    std::mutex write_mtx_;
    std::mutex reap_mtx_;
    std::atomic<bool> reaped_{false};
};

} // namespace voxpipe
