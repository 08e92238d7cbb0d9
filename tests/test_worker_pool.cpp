#include "worker_pool.hpp"
#include <chrono>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>
#include <cassert>

using namespace voxpipe;
using namespace std::chrono_literals;

static PoolConfig make_config(int workers, TaskType type = TaskType::Transcribe) {
    PoolConfig cfg;
    cfg.type = type;
    cfg.workers = workers;
    cfg.worker_bin = VOXPIPE_WORKER_BIN;
    cfg.worker_args = {"--allow-fault-injection"};
    cfg.startup_timeout_ms = 10000;
    return cfg;
}

static Task make_task(const std::string& text, int64_t delay_ms = 0, int priority = 1) {
    Task t;
    t.type = TaskType::Transcribe;
    t.id = make_task_id("t");
    t.payload["text"] = text;
    if (delay_ms > 0) t.payload["delay_ms"] = static_cast<Json::Int64>(delay_ms);
    t.priority = priority;
    return t;
}

static void check_invariant(const WorkerPool& pool) {
    PoolStatus s = pool.describe();
    assert(s.idle + s.busy + s.unhealthy == s.total);
    assert(s.idle >= 0 && s.busy >= 0 && s.unhealthy >= 0);
}

template<typename Pred>
static bool wait_for(Pred pred, std::chrono::milliseconds timeout) {
    auto until = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < until) {
        if (pred()) return true;
        std::this_thread::sleep_for(10ms);
    }
    return pred();
}

static void test_fifo_and_chunks() {
    WorkerPool pool(make_config(1));
    pool.start();
    assert(pool.wait_idle(1, 10s));

    std::mutex mtx;
    std::vector<int> order;
    std::vector<std::future<TaskResult>> futs;
    for (int i = 0; i < 5; ++i) {
        auto promise = std::make_shared<std::promise<TaskResult>>();
        futs.push_back(promise->get_future());
        pool.submit(make_task("task " + std::to_string(i), 20), [&, i, promise](const TaskResult& r) {
            {
                std::lock_guard<std::mutex> lk(mtx);
                order.push_back(i);
            }
            promise->set_value(r);
        });
    }
    for (auto& f : futs) {
        assert(f.wait_for(10s) == std::future_status::ready);
        assert(f.get().ok);
    }
    assert((order == std::vector<int>{0, 1, 2, 3, 4}));

    // partial chunks arrive before the terminal result
    std::vector<std::string> partials;
    auto promise = std::make_shared<std::promise<TaskResult>>();
    auto fut = promise->get_future();
    pool.submit(make_task("one two three four five six"),
                [promise](const TaskResult& r) { promise->set_value(r); },
                [&](const std::string&, int seq, const Json::Value& payload) {
                    assert(seq == static_cast<int>(partials.size()));
                    partials.push_back(payload["text"].asString());
                });
    TaskResult r = fut.get();
    assert(r.ok);
    assert(r.payload["text"].asString() == "one two three four five six");
    assert(partials.size() == 1 && partials[0] == "one two three");

    assert(wait_for([&]{ return pool.describe().completed == 6; }, 2s));
    check_invariant(pool);
    assert(pool.describe().failed == 0);
    pool.shutdown(2000);
    std::cout << "fifo ok\n";
}

static void test_two_workers_share_load() {
    WorkerPool pool(make_config(2, TaskType::Synthesize));
    pool.start();
    assert(pool.wait_idle(2, 10s));

    using Ms = std::chrono::milliseconds;
    std::mutex mtx;
    std::vector<int> order;
    std::vector<Ms> done_at(5);
    auto t0 = std::chrono::steady_clock::now();
    for (int i = 0; i < 5; ++i) {
        Task t;
        t.type = TaskType::Synthesize;
        t.id = make_task_id("tts");
        t.payload["text"] = "hello";
        t.payload["delay_ms"] = 300;
        pool.submit(std::move(t), [&, i](const TaskResult& r) {
            assert(r.ok);
            std::lock_guard<std::mutex> lk(mtx);
            order.push_back(i);
            done_at[i] = std::chrono::duration_cast<Ms>(std::chrono::steady_clock::now() - t0);
        });
    }
    // two dispatched at once, three waiting in submission order
    assert(wait_for([&]{
        PoolStatus s = pool.describe();
        return s.busy == 2 && s.queue_depth == 3;
    }, 250ms));
    check_invariant(pool);

    assert(wait_for([&]{ std::lock_guard<std::mutex> lk(mtx); return order.size() == 5; }, 10s));
    auto in_round = [&](size_t from, size_t to, int a, int b) {
        return (order[from] == a && order[to] == b) || (order[from] == b && order[to] == a);
    };
    assert(in_round(0, 1, 0, 1));
    assert(in_round(2, 3, 2, 3));
    assert(order[4] == 4);
    // each queued task waited for a slot to free up
    for (int i = 2; i < 4; ++i) assert(done_at[i] >= Ms(550));
    assert(done_at[4] >= Ms(850));
    // three rounds of 300ms on two workers, not five
    assert(done_at[4] < Ms(1500));
    pool.shutdown(2000);
    std::cout << "two workers ok\n";
}

static void test_back_to_back_tasks() {
    WorkerPool pool(make_config(1));
    pool.start();
    assert(pool.wait_idle(1, 10s));

    const int n = 5000;
    std::vector<std::future<TaskResult>> futs;
    futs.reserve(n);
    for (int i = 0; i < n; ++i) futs.push_back(pool.submit(make_task("hi")));
    int ok = 0;
    for (auto& f : futs) {
        assert(f.wait_for(60s) == std::future_status::ready);
        TaskResult r = f.get();
        if (r.ok) ++ok;
        else std::cerr << "failed: " << to_string(r.error.kind) << " " << r.error.message << "\n";
    }
    assert(ok == n);
    assert(wait_for([&]{ return pool.describe().completed == static_cast<uint64_t>(n); }, 2s));
    PoolStatus s = pool.describe();
    assert(s.failed == 0);
    assert(s.restarts == 0 && !s.degraded);
    pool.shutdown(2000);
    std::cout << "back to back ok\n";
}

static void test_priority() {
    WorkerPool pool(make_config(1));
    pool.start();
    assert(pool.wait_idle(1, 10s));

    std::mutex mtx;
    std::vector<std::string> done;
    auto record = [&](const std::string& tag) {
        return [&, tag](const TaskResult& r) {
            assert(r.ok);
            std::lock_guard<std::mutex> lk(mtx);
            done.push_back(tag);
        };
    };
    pool.submit(make_task("blocker", 300), record("blocker"));
    for (int i = 0; i < 10; ++i) {
        pool.submit(make_task("batch", 10, static_cast<int>(TaskPriority::Batch)), record("batch"));
    }
    pool.submit(make_task("urgent", 0, static_cast<int>(TaskPriority::Interactive)), record("urgent"));

    assert(wait_for([&]{ std::lock_guard<std::mutex> lk(mtx); return done.size() == 12; }, 20s));
    size_t urgent_at = 0;
    for (size_t i = 0; i < done.size(); ++i) {
        if (done[i] == "urgent") urgent_at = i;
    }
    assert(urgent_at <= 1);
    pool.shutdown(2000);
    std::cout << "priority ok\n";
}

static void test_crash_and_restart() {
    WorkerPool pool(make_config(1));
    pool.start();
    assert(pool.wait_idle(1, 10s));

    Task crash = make_task("boom");
    crash.payload["fault"] = "crash";
    TaskResult r = pool.submit(crash).get();
    assert(!r.ok);
    assert(r.error.kind == ErrorKind::WorkerCrashed);
    check_invariant(pool);

    assert(pool.wait_idle(1, 10s));
    PoolStatus s = pool.describe();
    assert(s.restarts == 1);
    assert(!s.degraded);
    r = pool.submit(make_task("after")).get();
    assert(r.ok && r.payload["text"].asString() == "after");
    pool.shutdown(2000);
    std::cout << "crash ok\n";
}

static void test_crashes_age_out_of_window() {
    PoolConfig cfg = make_config(1);
    cfg.max_restarts = 1;
    cfg.restart_window_ms = 500;
    WorkerPool pool(cfg);
    pool.start();
    assert(pool.wait_idle(1, 10s));

    for (int round = 1; round <= 2; ++round) {
        Task crash = make_task("boom");
        crash.payload["fault"] = "crash";
        TaskResult r = pool.submit(crash).get();
        assert(!r.ok && r.error.kind == ErrorKind::WorkerCrashed);
        assert(pool.wait_idle(1, 10s));
        // let this crash fall out of the window before the next one
        std::this_thread::sleep_for(700ms);
    }
    PoolStatus s = pool.describe();
    assert(s.restarts == 2);
    assert(!s.degraded && s.capacity == 1);
    assert(pool.submit(make_task("still here")).get().ok);
    pool.shutdown(2000);
    std::cout << "restart window ok\n";
}

static void test_timeouts() {
    WorkerPool pool(make_config(1));
    pool.start();
    assert(pool.wait_idle(1, 10s));

    auto blocker = pool.submit(make_task("blocker", 600));
    Task queued = make_task("late");
    queued.deadline_ms = 100;
    TaskResult r = pool.submit(queued).get();
    assert(!r.ok && r.error.kind == ErrorKind::QueueTimeout);
    assert(blocker.get().ok);

    Task slow = make_task("slow", 5000);
    slow.deadline_ms = 300;
    auto t0 = std::chrono::steady_clock::now();
    r = pool.submit(slow).get();
    assert(!r.ok && r.error.kind == ErrorKind::ExecutionTimeout);
    assert(std::chrono::steady_clock::now() - t0 < 2s);

    // the slot comes back after the kill
    assert(pool.wait_idle(1, 10s));
    assert(pool.submit(make_task("again")).get().ok);
    pool.shutdown(2000);
    std::cout << "timeouts ok\n";
}

static void test_cancel() {
    WorkerPool pool(make_config(1));
    pool.start();
    assert(pool.wait_idle(1, 10s));

    auto blocker = pool.submit(make_task("blocker", 400));
    Task queued = make_task("queued");
    auto queued_fut = pool.submit(queued);
    pool.cancel(queued.id);
    TaskResult r = queued_fut.get();
    assert(!r.ok && r.error.kind == ErrorKind::Cancelled);
    assert(blocker.get().ok);

    Task running = make_task("running", 400);
    auto running_fut = pool.submit(running);
    assert(wait_for([&]{ return pool.describe().busy == 1; }, 2s));
    pool.cancel(running.id);
    r = running_fut.get();
    assert(!r.ok && r.error.kind == ErrorKind::Cancelled);

    // the worker's late result is dropped and the slot is reused
    assert(pool.wait_idle(1, 5s));
    assert(pool.submit(make_task("next")).get().ok);
    pool.shutdown(2000);
    std::cout << "cancel ok\n";
}

static void test_unresponsive_slot_left_down() {
    PoolConfig cfg = make_config(1);
    cfg.worker_args.push_back("--fault-mode");
    cfg.worker_args.push_back("mute");
    cfg.health_interval_ms = 100;
    cfg.ping_timeout_ms = 100;
    cfg.max_restarts = 3;
    WorkerPool pool(cfg);
    pool.start();

    assert(wait_for([&]{ check_invariant(pool); return pool.describe().degraded; }, 20s));
    PoolStatus s = pool.describe();
    assert(s.restarts == 3);
    assert(s.capacity == 0);
    assert(s.unhealthy == 1);

    TaskResult r = pool.submit(make_task("nobody home")).get();
    assert(!r.ok && r.error.kind == ErrorKind::WorkerCrashed);
    pool.shutdown(1000);
    std::cout << "left down ok\n";
}

static void test_shutdown() {
    WorkerPool pool(make_config(2));
    pool.start();
    assert(pool.wait_idle(2, 10s));

    auto in_flight = pool.submit(make_task("finishing", 300));
    assert(wait_for([&]{ return pool.describe().busy == 1; }, 2s));
    pool.shutdown(3000);
    // busy work drains inside the grace period
    TaskResult r = in_flight.get();
    assert(r.ok);

    pool.shutdown(3000);
    r = pool.submit(make_task("too late")).get();
    assert(!r.ok && r.error.kind == ErrorKind::PoolShuttingDown);
    assert(!pool.describe().accepting);

    Task wrong = make_task("x");
    wrong.type = TaskType::Synthesize;
    WorkerPool other(make_config(1));
    r = other.submit(wrong).get();
    assert(!r.ok && r.error.kind == ErrorKind::UnknownTaskType);
    std::cout << "shutdown ok\n";
}

static void test_grace_expiry() {
    WorkerPool pool(make_config(1));
    pool.start();
    assert(pool.wait_idle(1, 10s));
    auto stuck = pool.submit(make_task("stuck", 10000));
    assert(wait_for([&]{ return pool.describe().busy == 1; }, 2s));
    auto t0 = std::chrono::steady_clock::now();
    pool.shutdown(200);
    assert(std::chrono::steady_clock::now() - t0 < 3s);
    TaskResult r = stuck.get();
    assert(!r.ok && r.error.kind == ErrorKind::PoolShuttingDown);
    std::cout << "grace expiry ok\n";
}

int main() {
    test_fifo_and_chunks();
    test_two_workers_share_load();
    test_back_to_back_tasks();
    test_priority();
    test_crash_and_restart();
    test_crashes_age_out_of_window();
    test_timeouts();
    test_cancel();
    test_unresponsive_slot_left_down();
    test_shutdown();
    test_grace_expiry();
    std::cout << "Worker pool test PASSED\n";
    return 0;
}
