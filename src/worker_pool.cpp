#include "worker_pool.hpp"
#include "worker_protocol.hpp"
#include <exception>
#include <iostream>

using namespace std::chrono_literals;

namespace voxpipe {

const char* to_string(SlotState s) {
    switch (s) {
    case SlotState::Starting: return "starting";
    case SlotState::Idle: return "idle";
    case SlotState::Busy: return "busy";
    case SlotState::Unhealthy: return "unhealthy";
    case SlotState::Terminating: return "terminating";
    }
    return "unknown";
}

WorkerPool::WorkerPool(PoolConfig cfg) : cfg_(std::move(cfg)) {
    slots_.resize(cfg_.workers > 0 ? static_cast<size_t>(cfg_.workers) : 0);
    for (size_t i = 0; i < slots_.size(); ++i) slots_[i].index = static_cast<int>(i);
    status_.type = cfg_.type;
    status_.total = static_cast<int>(slots_.size());
    status_.unhealthy = status_.total;
    status_.starting = status_.total;
}

WorkerPool::~WorkerPool() {
    shutdown(0);
}

void WorkerPool::start() {
    std::lock_guard<std::mutex> lk(lifecycle_mtx_);
    if (started_ || stopped_) return;
    started_ = true;
    for (auto& slot : slots_) spawn_slot(slot);
    last_health_ = Clock::now();
    accepting_.store(true);
    publish_status();
    loop_ = std::thread(&WorkerPool::loop, this);
    std::cout << "[WorkerPool] POOL_STARTED type=" << to_string(cfg_.type)
              << " workers=" << slots_.size() << "\n";
}

void WorkerPool::submit(Task task, ResultCallback on_done, ChunkCallback on_chunk) {
    if (task.id.empty()) task.id = make_task_id(to_string(cfg_.type));
    if (task.submitted_at == Clock::time_point{}) task.submitted_at = Clock::now();
    if (task.deadline_ms <= 0) task.deadline_ms = cfg_.default_deadline_ms;

    if (task.type != cfg_.type) {
        on_done(TaskResult::failure(task.id, ErrorKind::UnknownTaskType,
                                    std::string("pool serves ") + to_string(cfg_.type)));
        return;
    }
    if (!accepting_.load()) {
        on_done(TaskResult::failure(task.id, ErrorKind::PoolShuttingDown, "pool is not accepting tasks"));
        return;
    }

    ResultCallback fallback = on_done;
    std::string id = task.id;
    Event ev;
    ev.kind = EventKind::Submit;
    ev.pending.reset(new Pending{std::move(task), std::move(on_done), std::move(on_chunk)});
    if (!inbox_.post(std::move(ev))) {
        fallback(TaskResult::failure(id, ErrorKind::PoolShuttingDown, "pool is not accepting tasks"));
    }
}

std::future<TaskResult> WorkerPool::submit(Task task) {
    auto promise = std::make_shared<std::promise<TaskResult>>();
    auto fut = promise->get_future();
    submit(std::move(task), [promise](const TaskResult& r) { promise->set_value(r); });
    return fut;
}

void WorkerPool::cancel(const std::string& task_id) {
    Event ev;
    ev.kind = EventKind::Cancel;
    ev.task_id = task_id;
    inbox_.post(std::move(ev));
}

void WorkerPool::shutdown(int64_t grace_ms) {
    std::lock_guard<std::mutex> lk(lifecycle_mtx_);
    if (stopped_) return;
    stopped_ = true;
    accepting_.store(false);
    if (!started_) {
        publish_status();
        return;
    }
    Event ev;
    ev.kind = EventKind::Shutdown;
    ev.grace_ms = grace_ms;
    inbox_.post(std::move(ev));
    if (loop_.joinable()) loop_.join();
    std::cout << "[WorkerPool] POOL_STOPPED type=" << to_string(cfg_.type)
              << " completed=" << completed_ << " failed=" << failed_ << "\n";
}

PoolStatus WorkerPool::describe() const {
    std::lock_guard<std::mutex> lk(status_mtx_);
    return status_;
}

bool WorkerPool::wait_idle(int n, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lk(status_mtx_);
    return status_cv_.wait_for(lk, timeout, [&]{ return status_.idle >= n; });
}

void WorkerPool::loop() {
    while (true) {
        auto events = inbox_.drain(50ms);
        for (auto& ev : events) handle(ev);

        check_timers(Clock::now());
        restart_slots();
        if (!shutting_down_ && !has_live_slot()) {
            reject_all_queued(ErrorKind::WorkerCrashed, "no healthy workers");
        }
        dispatch();
        publish_status();

        if (shutting_down_ && all_stopped()) break;
    }

    inbox_.close();
    for (auto& ev : inbox_.drain(0ms)) {
        if (ev.kind == EventKind::Submit && ev.pending) {
            resolve(*ev.pending, TaskResult::failure(ev.pending->task.id, ErrorKind::PoolShuttingDown,
                                                     "pool is shutting down"));
        }
    }
    for (auto& slot : slots_) {
        if (slot.current) {
            resolve(*slot.current, TaskResult::failure(slot.current->task.id, ErrorKind::PoolShuttingDown,
                                                       "worker stopped during shutdown"));
            slot.current.reset();
        }
        slot.proc.reset();
    }
    slots_.clear();
    publish_status();
}

void WorkerPool::handle(Event& ev) {
    switch (ev.kind) {
    case EventKind::Submit:
        handle_submit(std::move(ev.pending));
        break;
    case EventKind::Cancel:
        handle_cancel(ev.task_id);
        break;
    case EventKind::WorkerLine:
        if (ev.slot >= 0 && ev.slot < static_cast<int>(slots_.size()) &&
            slots_[ev.slot].generation == ev.generation) {
            handle_line(slots_[ev.slot], ev.line);
        }
        break;
    case EventKind::WorkerExited:
        if (ev.slot >= 0 && ev.slot < static_cast<int>(slots_.size()) &&
            slots_[ev.slot].generation == ev.generation) {
            handle_exit(slots_[ev.slot], ev.exit_status);
        }
        break;
    case EventKind::Shutdown:
        begin_shutdown(ev.grace_ms);
        break;
    }
}

void WorkerPool::handle_submit(std::unique_ptr<Pending> p) {
    ++submitted_;
    if (shutting_down_) {
        resolve(*p, TaskResult::failure(p->task.id, ErrorKind::PoolShuttingDown, "pool is shutting down"));
        return;
    }
    if (!has_live_slot()) {
        resolve(*p, TaskResult::failure(p->task.id, ErrorKind::WorkerCrashed, "no healthy workers"));
        return;
    }
    int prio = p->task.priority;
    queue_[prio].push_back(std::move(p));
}

void WorkerPool::handle_cancel(const std::string& task_id) {
    for (auto it = queue_.begin(); it != queue_.end(); ++it) {
        auto& dq = it->second;
        for (auto qit = dq.begin(); qit != dq.end(); ++qit) {
            if ((*qit)->task.id != task_id) continue;
            std::unique_ptr<Pending> p = std::move(*qit);
            dq.erase(qit);
            if (dq.empty()) queue_.erase(it);
            resolve(*p, TaskResult::failure(task_id, ErrorKind::Cancelled, "cancelled while queued"));
            return;
        }
    }
    for (auto& slot : slots_) {
        if (slot.current && slot.current->task.id == task_id) {
            // The worker keeps running; its result will be dropped.
            resolve(*slot.current, TaskResult::failure(task_id, ErrorKind::Cancelled, "cancelled while running"));
            return;
        }
    }
}

void WorkerPool::handle_line(Slot& slot, const std::string& line) {
    WorkerMessage msg;
    std::string err;
    if (!decode_message(line, msg, err)) {
        fail_slot(slot, ErrorKind::WorkerCrashed, "protocol violation: " + err);
        return;
    }
    const auto now = Clock::now();

    switch (msg.kind) {
    case MessageKind::Ready:
        if (slot.state == SlotState::Starting) {
            slot.state = SlotState::Idle;
            slot.state_since = now;
            slot.last_heartbeat = now;
            std::cout << "[WorkerPool] SLOT_READY type=" << to_string(cfg_.type) << " slot=" << slot.index
                      << " pid=" << msg.pid << "\n";
        }
        return;
    case MessageKind::Pong:
        if (slot.ping_outstanding && msg.nonce == slot.ping_nonce) {
            slot.ping_outstanding = false;
            slot.last_heartbeat = now;
        }
        return;
    case MessageKind::Chunk:
        if (!slot.current || slot.current->task.id != msg.id) {
            fail_slot(slot, ErrorKind::WorkerCrashed, "chunk for unknown task " + msg.id);
            return;
        }
        slot.last_heartbeat = now;
        if (slot.current->on_chunk) {
            try {
                slot.current->on_chunk(msg.id, msg.seq, msg.payload);
            } catch (const std::exception& e) {
                std::cerr << "[WorkerPool] CHUNK_CALLBACK_FAILED task=" << msg.id << " err=" << e.what() << "\n";
            }
        }
        return;
    case MessageKind::Result:
    case MessageKind::Error: {
        if (!slot.current || slot.current->task.id != msg.id) {
            fail_slot(slot, ErrorKind::WorkerCrashed, "correlation id mismatch: got '" + msg.id + "'");
            return;
        }
        TaskResult r = msg.kind == MessageKind::Result
            ? TaskResult::success(msg.id, std::move(msg.payload))
            : TaskResult::failure(msg.id, msg.error.kind, msg.error.message);
        finish_task(slot, r);
        return;
    }
    default:
        fail_slot(slot, ErrorKind::WorkerCrashed,
                  std::string("unexpected message kind ") + to_string(msg.kind));
        return;
    }
}

void WorkerPool::handle_exit(Slot& slot, int status) {
    if (slot.state == SlotState::Terminating) {
        if (slot.current) {
            resolve(*slot.current, TaskResult::failure(slot.current->task.id, ErrorKind::PoolShuttingDown,
                                                        "worker stopped during shutdown"));
            slot.current.reset();
        }
        std::cout << "[WorkerPool] SLOT_STOPPED type=" << to_string(cfg_.type) << " slot=" << slot.index
                  << " status=" << status << "\n";
        return;
    }
    if (slot.state == SlotState::Unhealthy) return;
    fail_slot(slot, ErrorKind::WorkerCrashed, "worker exited status=" + std::to_string(status));
}

void WorkerPool::begin_shutdown(int64_t grace_ms) {
    if (shutting_down_) return;
    shutting_down_ = true;
    shutdown_deadline_ = Clock::now() + std::chrono::milliseconds(grace_ms);
    std::cout << "[WorkerPool] POOL_DRAINING type=" << to_string(cfg_.type) << " grace_ms=" << grace_ms
              << " queued=" << queued() << "\n";

    reject_all_queued(ErrorKind::PoolShuttingDown, "pool is shutting down");
    for (auto& slot : slots_) {
        slot.restart_pending = false;
        switch (slot.state) {
        case SlotState::Idle:
            send_shutdown(slot);
            break;
        case SlotState::Starting:
            if (slot.proc) slot.proc->kill_now();
            slot.state = SlotState::Terminating;
            slot.state_since = Clock::now();
            break;
        case SlotState::Busy:
        case SlotState::Unhealthy:
        case SlotState::Terminating:
            break;
        }
    }
}

void WorkerPool::spawn_slot(Slot& slot) {
    slot.proc.reset();
    slot.generation = ++next_generation_;
    slot.state = SlotState::Starting;
    slot.state_since = Clock::now();
    slot.ping_outstanding = false;
    slot.shutdown_sent = false;

    std::vector<std::string> argv{cfg_.worker_bin, "--type", to_string(cfg_.type)};
    argv.insert(argv.end(), cfg_.worker_args.begin(), cfg_.worker_args.end());

    const int idx = slot.index;
    const uint64_t gen = slot.generation;
    std::unique_ptr<WorkerProcess> proc(new WorkerProcess());
    std::string err;
    bool ok = proc->spawn(
        argv,
        [this, idx, gen](const std::string& line) {
            Event ev;
            ev.kind = EventKind::WorkerLine;
            ev.slot = idx;
            ev.generation = gen;
            ev.line = line;
            inbox_.post(std::move(ev));
        },
        [this, idx, gen](int status) {
            Event ev;
            ev.kind = EventKind::WorkerExited;
            ev.slot = idx;
            ev.generation = gen;
            ev.exit_status = status;
            inbox_.post(std::move(ev));
        },
        err);
    slot.proc = std::move(proc);
    if (!ok) {
        std::cerr << "[WorkerPool] SPAWN_FAILED type=" << to_string(cfg_.type) << " slot=" << idx
                  << " err=" << err << "\n";
        fail_slot(slot, ErrorKind::WorkerCrashed, "spawn failed: " + err);
        return;
    }
    std::cout << "[WorkerPool] SLOT_SPAWNED type=" << to_string(cfg_.type) << " slot=" << idx
              << " pid=" << slot.proc->pid() << " gen=" << gen << "\n";
}

void WorkerPool::fail_slot(Slot& slot, ErrorKind kind, const std::string& reason) {
    const auto now = Clock::now();
    std::cout << "[WorkerPool] SLOT_FAILED type=" << to_string(cfg_.type) << " slot=" << slot.index
              << " kind=" << to_string(kind) << " reason=\"" << reason << "\"\n";

    if (slot.current) {
        std::unique_ptr<Pending> p = std::move(slot.current);
        resolve(*p, TaskResult::failure(p->task.id, kind, reason));
    }
    if (slot.proc) slot.proc->kill_now();
    slot.state = SlotState::Unhealthy;
    slot.state_since = now;
    slot.ping_outstanding = false;
    if (shutting_down_) return;

    slot.crashes.push_back(now);
    while (!slot.crashes.empty() && elapsed_ms(slot.crashes.front(), now) > cfg_.restart_window_ms) {
        slot.crashes.pop_front();
    }
    if (static_cast<int>(slot.crashes.size()) > cfg_.max_restarts) {
        slot.down = true;
        slot.restart_pending = false;
        std::cout << "[WorkerPool] SLOT_LEFT_DOWN type=" << to_string(cfg_.type) << " slot=" << slot.index
                  << " crashes=" << slot.crashes.size() << " window_ms=" << cfg_.restart_window_ms << "\n";
        return;
    }
    slot.restart_pending = true;
}

void WorkerPool::finish_task(Slot& slot, const TaskResult& result) {
    std::unique_ptr<Pending> p = std::move(slot.current);
    resolve(*p, result);
    slot.last_heartbeat = Clock::now();
    if (shutting_down_) {
        send_shutdown(slot);
        return;
    }
    slot.state = SlotState::Idle;
    slot.state_since = slot.last_heartbeat;
}

void WorkerPool::send_shutdown(Slot& slot) {
    if (slot.proc && !slot.shutdown_sent) {
        WorkerMessage m;
        m.kind = MessageKind::Shutdown;
        slot.proc->send_line(encode_message(m));
        slot.proc->close_stdin();
        slot.shutdown_sent = true;
    }
    slot.state = SlotState::Terminating;
    slot.state_since = Clock::now();
}

void WorkerPool::dispatch() {
    if (shutting_down_) return;
    for (auto& slot : slots_) {
        if (slot.state != SlotState::Idle) continue;
        if (queue_.empty()) return;

        auto it = queue_.begin();
        std::unique_ptr<Pending> next = std::move(it->second.front());
        it->second.pop_front();
        if (it->second.empty()) queue_.erase(it);

        slot.current = std::move(next);
        slot.state = SlotState::Busy;
        slot.state_since = Clock::now();
        if (!slot.proc->send_line(encode_message(make_task_message(slot.current->task)))) {
            fail_slot(slot, ErrorKind::WorkerCrashed, "write to worker failed");
        }
    }
}

void WorkerPool::check_timers(Clock::time_point now) {
    for (auto it = queue_.begin(); it != queue_.end();) {
        auto& dq = it->second;
        for (auto qit = dq.begin(); qit != dq.end();) {
            const Task& t = (*qit)->task;
            if (t.deadline_ms > 0 && elapsed_ms(t.submitted_at, now) >= t.deadline_ms) {
                std::unique_ptr<Pending> p = std::move(*qit);
                qit = dq.erase(qit);
                resolve(*p, TaskResult::failure(p->task.id, ErrorKind::QueueTimeout,
                                                "not scheduled within " + std::to_string(p->task.deadline_ms) + "ms"));
            } else {
                ++qit;
            }
        }
        it = dq.empty() ? queue_.erase(it) : std::next(it);
    }

    for (auto& slot : slots_) {
        switch (slot.state) {
        case SlotState::Starting:
            if (elapsed_ms(slot.state_since, now) > cfg_.startup_timeout_ms) {
                fail_slot(slot, ErrorKind::WorkerCrashed,
                          "no ready within " + std::to_string(cfg_.startup_timeout_ms) + "ms");
            }
            break;
        case SlotState::Busy:
            if (shutting_down_ && now >= shutdown_deadline_) {
                std::cout << "[WorkerPool] SLOT_FORCE_KILLED type=" << to_string(cfg_.type)
                          << " slot=" << slot.index << "\n";
                if (slot.current) {
                    resolve(*slot.current, TaskResult::failure(slot.current->task.id, ErrorKind::PoolShuttingDown,
                                                               "killed after shutdown grace period"));
                    slot.current.reset();
                }
                if (slot.proc) slot.proc->kill_now();
                slot.state = SlotState::Terminating;
                break;
            }
            if (slot.current && slot.current->task.deadline_ms > 0 &&
                elapsed_ms(slot.current->task.submitted_at, now) >= slot.current->task.deadline_ms) {
                fail_slot(slot, ErrorKind::ExecutionTimeout,
                          "task exceeded " + std::to_string(slot.current->task.deadline_ms) + "ms deadline");
                break;
            }
            [[fallthrough]];
        case SlotState::Idle:
            if (slot.ping_outstanding && elapsed_ms(slot.ping_sent, now) > cfg_.ping_timeout_ms) {
                fail_slot(slot, ErrorKind::WorkerCrashed,
                          "no pong within " + std::to_string(cfg_.ping_timeout_ms) + "ms");
            }
            break;
        case SlotState::Terminating:
            if (shutting_down_ && now >= shutdown_deadline_ && slot.proc && !slot.proc->exited()) {
                slot.proc->kill_now();
            }
            break;
        case SlotState::Unhealthy:
            break;
        }
    }

    if (shutting_down_ || elapsed_ms(last_health_, now) < cfg_.health_interval_ms) return;
    last_health_ = now;
    for (auto& slot : slots_) {
        if ((slot.state != SlotState::Idle && slot.state != SlotState::Busy) || slot.ping_outstanding) continue;
        WorkerMessage ping;
        ping.kind = MessageKind::Ping;
        ping.nonce = ++next_nonce_;
        slot.ping_nonce = ping.nonce;
        slot.ping_outstanding = true;
        slot.ping_sent = now;
        if (!slot.proc->send_line(encode_message(ping))) {
            fail_slot(slot, ErrorKind::WorkerCrashed, "write to worker failed");
        }
    }
}

void WorkerPool::restart_slots() {
    if (shutting_down_) return;
    for (auto& slot : slots_) {
        if (!slot.restart_pending) continue;
        slot.restart_pending = false;
        ++restarts_;
        std::cout << "[WorkerPool] SLOT_RESTARTED type=" << to_string(cfg_.type) << " slot=" << slot.index
                  << " recent_crashes=" << slot.crashes.size() << " pool_restarts=" << restarts_ << "\n";
        spawn_slot(slot);
    }
}

void WorkerPool::reject_all_queued(ErrorKind kind, const std::string& reason) {
    for (auto& kv : queue_) {
        for (auto& p : kv.second) {
            resolve(*p, TaskResult::failure(p->task.id, kind, reason));
        }
    }
    queue_.clear();
}

void WorkerPool::resolve(Pending& p, const TaskResult& result) {
    if (!p.on_done) return;
    ResultCallback cb = std::move(p.on_done);
    p.on_done = nullptr;
    p.on_chunk = nullptr;
    if (result.ok) ++completed_; else ++failed_;
    try {
        cb(result);
    } catch (const std::exception& e) {
        std::cerr << "[WorkerPool] RESULT_CALLBACK_FAILED task=" << result.id << " err=" << e.what() << "\n";
    }
}

bool WorkerPool::has_live_slot() const {
    for (const auto& slot : slots_) {
        if (!slot.down) return true;
    }
    return false;
}

bool WorkerPool::all_stopped() const {
    for (const auto& slot : slots_) {
        if (slot.proc && !slot.proc->exited()) return false;
    }
    return true;
}

size_t WorkerPool::queued() const {
    size_t n = 0;
    for (const auto& kv : queue_) n += kv.second.size();
    return n;
}

void WorkerPool::publish_status() {
    PoolStatus s;
    s.type = cfg_.type;
    s.total = static_cast<int>(slots_.size());
    for (const auto& slot : slots_) {
        switch (slot.state) {
        case SlotState::Idle: ++s.idle; break;
        case SlotState::Busy: ++s.busy; break;
        case SlotState::Starting: ++s.starting; break;
        case SlotState::Terminating: ++s.terminating; break;
        case SlotState::Unhealthy: break;
        }
        if (slot.down) s.degraded = true;
        else ++s.capacity;
    }
    s.unhealthy = s.total - s.idle - s.busy;
    s.queue_depth = queued();
    s.accepting = accepting_.load() && !shutting_down_;
    s.submitted = submitted_;
    s.completed = completed_;
    s.failed = failed_;
    s.restarts = restarts_;
    {
        std::lock_guard<std::mutex> lk(status_mtx_);
        status_ = s;
    }
    status_cv_.notify_all();
}

} // namespace voxpipe
