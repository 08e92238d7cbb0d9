#pragma once
#include "session_gateway.hpp"
#include "worker_pool.hpp"
#include <cstdint>
#include <string>

namespace voxpipe {

struct PlatformConfig {
    std::string bind = "127.0.0.1";
    uint16_t port = 8765;
    std::string worker_bin;          // empty: voxpipe_worker beside this binary

    int transcribe_workers = 2;
    int generate_workers = 2;
    int synthesize_workers = 2;
    int clone_workers = 1;
    int vad_workers = 1;
    std::string vad_model;

    int64_t health_interval_ms = 5000;
    int64_t ping_timeout_ms = 2000;
    int64_t startup_timeout_ms = 30000;
    int max_restarts = 3;
    int64_t restart_window_ms = 60000;
    int64_t shutdown_grace_ms = 5000;

    int64_t task_deadline_ms = 30000;
    int64_t idle_timeout_ms = 300000;
    int utterance_gap_ms = 700;
    double silence_rms = 500.0;
    int max_context_turns = 20;

    size_t metrics_capacity = 1000;
    std::string metrics_export;
    int stats_interval_s = 60;
};

// Returns false with a message on an unknown flag or a bad value.
// `help` is set when --help was given.
bool parse_platform_config(int argc, char** argv, PlatformConfig& cfg, std::string& err, bool& help);

const char* platform_usage();

// Directory of the running executable, from /proc/self/exe.
std::string executable_dir();

PoolConfig pool_config_for(const PlatformConfig& cfg, TaskType type);
GatewayConfig gateway_config_for(const PlatformConfig& cfg);

} // namespace voxpipe
