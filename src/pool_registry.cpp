#include "pool_registry.hpp"
#include <iostream>
#include <stdexcept>
#include <thread>

namespace voxpipe {

PoolRegistry::~PoolRegistry() {
    shutdown(0);
}

WorkerPool& PoolRegistry::add_pool(const PoolConfig& cfg) {
    auto& slot = pools_[static_cast<size_t>(cfg.type)];
    if (slot) {
        throw std::runtime_error(std::string("pool already registered for ") + to_string(cfg.type));
    }
    slot.reset(new WorkerPool(cfg));
    slot->start();
    std::cout << "[PoolRegistry] POOL_REGISTERED type=" << to_string(cfg.type)
              << " workers=" << cfg.workers << "\n";
    return *slot;
}

void PoolRegistry::validate(const std::vector<TaskType>& required) const {
    for (TaskType t : required) {
        if (!has_pool(t)) {
            throw std::runtime_error(std::string("UnknownTaskType: no pool registered for ") + to_string(t));
        }
    }
}

bool PoolRegistry::has_pool(TaskType type) const {
    return pool(type) != nullptr;
}

WorkerPool* PoolRegistry::pool(TaskType type) const {
    size_t idx = static_cast<size_t>(type);
    return idx < pools_.size() ? pools_[idx].get() : nullptr;
}

void PoolRegistry::route(Task task, ResultCallback on_done, ChunkCallback on_chunk) {
    WorkerPool* p = pool(task.type);
    if (!p) {
        if (task.id.empty()) task.id = make_task_id("unrouted");
        std::cerr << "[PoolRegistry] UNKNOWN_TASK_TYPE type=" << to_string(task.type) << " id=" << task.id << "\n";
        on_done(TaskResult::failure(task.id, ErrorKind::UnknownTaskType,
                                    std::string("no pool registered for ") + to_string(task.type)));
        return;
    }
    p->submit(std::move(task), std::move(on_done), std::move(on_chunk));
}

std::future<TaskResult> PoolRegistry::route(Task task) {
    auto promise = std::make_shared<std::promise<TaskResult>>();
    auto fut = promise->get_future();
    route(std::move(task), [promise](const TaskResult& r) { promise->set_value(r); });
    return fut;
}

void PoolRegistry::cancel(TaskType type, const std::string& task_id) {
    if (WorkerPool* p = pool(type)) p->cancel(task_id);
}

std::vector<PoolStatus> PoolRegistry::describe() const {
    std::vector<PoolStatus> out;
    for (const auto& p : pools_) {
        if (p) out.push_back(p->describe());
    }
    return out;
}

void PoolRegistry::shutdown(int64_t grace_ms) {
    std::vector<std::thread> drains;
    for (auto& p : pools_) {
        if (!p) continue;
        WorkerPool* raw = p.get();
        drains.emplace_back([raw, grace_ms]{ raw->shutdown(grace_ms); });
    }
    for (auto& t : drains) t.join();
}

} // namespace voxpipe
