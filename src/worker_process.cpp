#include "worker_process.hpp"
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <iostream>

namespace voxpipe {

namespace {

std::once_flag g_sigpipe_once;

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

} // namespace

WorkerProcess::~WorkerProcess() {
    close_stdin();
    kill_now();
    if (reader_.joinable()) reader_.join();
    close_fd(stdout_fd_);
}

bool WorkerProcess::spawn(const std::vector<std::string>& argv, LineHandler on_line,
                          ExitHandler on_exit, std::string& err) {
    if (argv.empty()) {
        err = "empty argv";
        return false;
    }
    // A dead worker must surface as a failed write, not kill the service.
    std::call_once(g_sigpipe_once, []{ ::signal(SIGPIPE, SIG_IGN); });

    int in_pipe[2];
    int out_pipe[2];
    if (::pipe2(in_pipe, O_CLOEXEC) != 0) {
        err = std::string("pipe: ") + std::strerror(errno);
        return false;
    }
    if (::pipe2(out_pipe, O_CLOEXEC) != 0) {
        err = std::string("pipe: ") + std::strerror(errno);
        ::close(in_pipe[0]);
        ::close(in_pipe[1]);
        return false;
    }

    // argv is built before fork; the child only calls async-signal-safe functions.
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        err = std::string("fork: ") + std::strerror(errno);
        ::close(in_pipe[0]); ::close(in_pipe[1]);
        ::close(out_pipe[0]); ::close(out_pipe[1]);
        return false;
    }
    if (pid == 0) {
        ::signal(SIGPIPE, SIG_DFL);
        ::dup2(in_pipe[0], STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::execv(cargv[0], cargv.data());
        _exit(127);
    }

    ::close(in_pipe[0]);
    ::close(out_pipe[1]);
    pid_ = pid;
    stdin_fd_ = in_pipe[1];
    stdout_fd_ = out_pipe[0];
    on_line_ = std::move(on_line);
    on_exit_ = std::move(on_exit);
    reaped_.store(false, std::memory_order_release);
    reader_ = std::thread(&WorkerProcess::reader_loop, this);
    return true;
}

bool WorkerProcess::send_line(const std::string& line) {
    std::lock_guard<std::mutex> lk(write_mtx_);
    if (stdin_fd_ < 0) return false;
    std::string buf = line;
    buf.push_back('\n');
    size_t off = 0;
    while (off < buf.size()) {
        ssize_t n = ::write(stdin_fd_, buf.data() + off, buf.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        off += static_cast<size_t>(n);
    }
    return true;
}

void WorkerProcess::close_stdin() {
    std::lock_guard<std::mutex> lk(write_mtx_);
    close_fd(stdin_fd_);
}

void WorkerProcess::terminate() {
    signal_child(SIGTERM);
}

void WorkerProcess::kill_now() {
    signal_child(SIGKILL);
}

void WorkerProcess::signal_child(int sig) {
    std::lock_guard<std::mutex> lk(reap_mtx_);
    if (pid_ <= 0 || reaped_.load(std::memory_order_acquire)) return;
    ::kill(pid_, sig);
}

void WorkerProcess::reader_loop() {
    std::string pending;
    char buf[4096];
    while (true) {
        ssize_t n = ::read(stdout_fd_, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (n == 0) break;
        pending.append(buf, static_cast<size_t>(n));
        size_t start = 0;
        size_t nl;
        while ((nl = pending.find('\n', start)) != std::string::npos) {
            std::string line = pending.substr(start, nl - start);
            start = nl + 1;
            if (!line.empty() && on_line_) on_line_(line);
        }
        pending.erase(0, start);
    }

    // Wait without reaping first so signal_child never races a recycled pid.
    siginfo_t info;
    std::memset(&info, 0, sizeof(info));
    while (::waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOWAIT) != 0 && errno == EINTR) {}

    int status = 0;
    {
        std::lock_guard<std::mutex> lk(reap_mtx_);
        while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {}
        reaped_.store(true, std::memory_order_release);
    }
    int code = WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
    if (on_exit_) on_exit_(code);
}

} // namespace voxpipe
