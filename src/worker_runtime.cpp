#include "worker_runtime.hpp"
#include <unistd.h>
#include <chrono>
#include <cstdlib>
#include <exception>
#include <iostream>

namespace voxpipe {

WorkerRuntime::WorkerRuntime(WorkerOptions opts, std::unique_ptr<TaskBackend> backend)
    : opts_(std::move(opts)), backend_(std::move(backend)) {}

WorkerRuntime::~WorkerRuntime() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (executor_.joinable()) executor_.join();
}

int WorkerRuntime::run(std::istream& in, std::ostream& out) {
    out_ = &out;
    const char* type = to_string(opts_.type);
    try {
        backend_->load();
    } catch (const std::exception& e) {
        std::cerr << "[Worker] LOAD_FAILED type=" << type << " err=" << e.what() << "\n";
        return 1;
    }

    if (opts_.fault_mode != "no-ready") {
        WorkerMessage ready;
        ready.kind = MessageKind::Ready;
        ready.type = opts_.type;
        ready.pid = ::getpid();
        emit(ready);
    }
    std::cerr << "[Worker] READY type=" << type << " backend=" << backend_->name()
              << " pid=" << ::getpid() << "\n";

    executor_ = std::thread(&WorkerRuntime::executor_loop, this);

    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        WorkerMessage msg;
        std::string err;
        if (!decode_message(line, msg, err)) {
            std::cerr << "[Worker] BAD_MESSAGE type=" << type << " err=" << err << "\n";
            continue;
        }

        if (msg.kind == MessageKind::Ping) {
            if (opts_.fault_mode == "mute") continue;
            WorkerMessage pong;
            pong.kind = MessageKind::Pong;
            pong.nonce = msg.nonce;
            emit(pong);
        } else if (msg.kind == MessageKind::Task) {
            std::unique_lock<std::mutex> lk(mtx_);
            if (busy_) {
                std::string running = running_id_;
                lk.unlock();
                emit(make_error_message(msg.id, ErrorKind::WorkerBusy, "worker is executing " + running));
                continue;
            }
            busy_ = true;
            running_id_ = msg.id;
            pending_.reset(new WorkerMessage(std::move(msg)));
            lk.unlock();
            cv_.notify_one();
        } else if (msg.kind == MessageKind::Shutdown) {
            std::cerr << "[Worker] SHUTDOWN type=" << type << "\n";
            break;
        } else {
            std::cerr << "[Worker] UNEXPECTED_MESSAGE type=" << type << " kind=" << to_string(msg.kind) << "\n";
        }
    }

    // Let the in-flight task finish before exiting.
    {
        std::lock_guard<std::mutex> lk(mtx_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (executor_.joinable()) executor_.join();
    std::cerr << "[Worker] EXIT type=" << type << "\n";
    return 0;
}

void WorkerRuntime::executor_loop() {
    while (true) {
        std::unique_ptr<WorkerMessage> task;
        {
            std::unique_lock<std::mutex> lk(mtx_);
            cv_.wait(lk, [&]{ return pending_ != nullptr || stopping_; });
            if (!pending_) return;
            task = std::move(pending_);
        }
        WorkerMessage done = execute(*task);
        // Free the worker before the pool can see the outcome and send the next task.
        {
            std::lock_guard<std::mutex> lk(mtx_);
            busy_ = false;
            running_id_.clear();
        }
        emit(done);
    }
}

WorkerMessage WorkerRuntime::execute(const WorkerMessage& task) {
    const auto started = Clock::now();
    if (task.type != opts_.type) {
        return make_error_message(task.id, ErrorKind::UnknownTaskType,
                                  std::string("worker serves ") + to_string(opts_.type));
    }

    std::string fault;
    if (opts_.allow_fault_injection && task.payload.isObject()) {
        int64_t delay_ms = task.payload.get("delay_ms", 0).asInt64();
        if (delay_ms > 0) std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
        fault = task.payload.get("fault", "").asString();
        if (fault == "crash") {
            std::cerr << "[Worker] FAULT_CRASH id=" << task.id << "\n";
            std::_Exit(3);
        }
        if (fault == "hang") {
            std::cerr << "[Worker] FAULT_HANG id=" << task.id << "\n";
            while (true) std::this_thread::sleep_for(std::chrono::seconds(1));
        }
    }

    try {
        if (fault == "throw") throw std::runtime_error("injected fault");
        int seq = 0;
        Json::Value result = backend_->execute(task.payload, [&](Json::Value chunk) {
            emit(make_chunk_message(task.id, seq++, std::move(chunk)));
        });
        std::cerr << "[Worker] TASK_DONE type=" << to_string(opts_.type) << " id=" << task.id
                  << " chunks=" << seq << " ms=" << elapsed_ms(started, Clock::now()) << "\n";
        return make_result_message(task.id, std::move(result));
    } catch (const BackendError& e) {
        std::cerr << "[Worker] TASK_FAILED type=" << to_string(opts_.type) << " id=" << task.id
                  << " kind=" << to_string(e.kind()) << " err=" << e.what() << "\n";
        return make_error_message(task.id, e.kind(), e.what());
    } catch (const std::exception& e) {
        std::cerr << "[Worker] TASK_FAILED type=" << to_string(opts_.type) << " id=" << task.id
                  << " err=" << e.what() << "\n";
        return make_error_message(task.id, ErrorKind::TaskFailed, e.what());
    }
}

void WorkerRuntime::emit(const WorkerMessage& msg) {
    std::lock_guard<std::mutex> lk(out_mtx_);
    *out_ << encode_message(msg) << '\n';
    out_->flush();
}

} // namespace voxpipe
