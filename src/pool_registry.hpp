#pragma once
#include "include/voxpipe.hpp"
#include "task_router.hpp"
#include "worker_pool.hpp"
#include <array>
#include <future>
#include <memory>
#include <vector>

namespace voxpipe {

// One WorkerPool per task type. Pools are added at startup, before any
// task is routed; after that the table is read-only.
class PoolRegistry : public TaskRouter {
public:
    PoolRegistry() = default;
    ~PoolRegistry() override;

    // Creates and starts the pool. Throws std::runtime_error if the type
    // already has a pool.
    WorkerPool& add_pool(const PoolConfig& cfg);

    // Throws std::runtime_error naming the first type without a pool.
    void validate(const std::vector<TaskType>& required) const;

    bool has_pool(TaskType type) const;
    WorkerPool* pool(TaskType type) const;

    void route(Task task, ResultCallback on_done, ChunkCallback on_chunk = nullptr) override;
    std::future<TaskResult> route(Task task);
    void cancel(TaskType type, const std::string& task_id) override;

    std::vector<PoolStatus> describe() const;

    // Drains every pool concurrently. Idempotent.
    void shutdown(int64_t grace_ms);

private:
    std::array<std::unique_ptr<WorkerPool>, kTaskTypeCount> pools_;
};

} // namespace voxpipe
