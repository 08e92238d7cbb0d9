#pragma once
#include "include/voxpipe.hpp"
#include <string>

namespace voxpipe {

// Where pipeline stages send their tasks. Implemented by PoolRegistry;
// tests substitute a scripted router.
class TaskRouter {
public:
    virtual ~TaskRouter() = default;
    // on_done is invoked exactly once; on_chunk zero or more times before it.
    virtual void route(Task task, ResultCallback on_done, ChunkCallback on_chunk) = 0;
    // Best effort: a queued task is withdrawn, a running one is detached.
    virtual void cancel(TaskType type, const std::string& task_id) = 0;
};

} // namespace voxpipe
