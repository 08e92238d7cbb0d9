#include "config.hpp"
#include <cerrno>
#include <cstdlib>
#include <limits.h>
#include <unistd.h>

namespace voxpipe {

namespace {

bool parse_i64(const std::string& flag, const std::string& v, int64_t lo, int64_t hi, int64_t& out,
               std::string& err) {
    if (v.empty()) {
        err = flag + " needs a value";
        return false;
    }
    errno = 0;
    char* end = nullptr;
    long long n = std::strtoll(v.c_str(), &end, 10);
    if (errno != 0 || end == v.c_str() || *end != '\0' || n < lo || n > hi) {
        err = flag + ": expected an integer in [" + std::to_string(lo) + ", " + std::to_string(hi) + "], got '" + v + "'";
        return false;
    }
    out = n;
    return true;
}

template<typename T>
bool parse_num(const std::string& flag, const std::string& v, int64_t lo, int64_t hi, T& out, std::string& err) {
    int64_t n = 0;
    if (!parse_i64(flag, v, lo, hi, n, err)) return false;
    out = static_cast<T>(n);
    return true;
}

} // namespace

const char* platform_usage() {
    return "usage: voxpipe_gateway [options]\n"
           "  --bind ADDR                 listen address (127.0.0.1)\n"
           "  --port N                    listen port (8765)\n"
           "  --worker-bin PATH           worker executable (voxpipe_worker beside this binary)\n"
           "  --transcribe-workers N      (2)\n"
           "  --generate-workers N        (2)\n"
           "  --synthesize-workers N      (2)\n"
           "  --clone-workers N           (1)\n"
           "  --vad-workers N             (1)\n"
           "  --vad-model PATH            Silero VAD onnx model for VAD workers\n"
           "  --health-interval-ms N      (5000)\n"
           "  --ping-timeout-ms N         (2000)\n"
           "  --startup-timeout-ms N      (30000)\n"
           "  --max-restarts N            (3)\n"
           "  --restart-window-ms N       (60000)\n"
           "  --shutdown-grace-ms N       (5000)\n"
           "  --task-deadline-ms N        (30000)\n"
           "  --idle-timeout-ms N         (300000)\n"
           "  --utterance-gap-ms N        (700)\n"
           "  --silence-rms N             (500)\n"
           "  --max-context-turns N       (20)\n"
           "  --metrics-capacity N        (1000)\n"
           "  --metrics-export FILE       write turn records at shutdown (.csv or .json)\n"
           "  --stats-interval-s N        (60, 0 disables)\n";
}

bool parse_platform_config(int argc, char** argv, PlatformConfig& cfg, std::string& err, bool& help) {
    const int64_t kMaxMs = 24LL * 3600 * 1000;
    help = false;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto next = [&](int& idx){ return (idx+1 < argc) ? std::string(argv[++idx]) : ""; };
        bool ok = true;
        if (a == "--help" || a == "-h") { help = true; return true; }
        else if (a == "--bind") { cfg.bind = next(i); ok = !cfg.bind.empty(); if (!ok) err = "--bind needs a value"; }
        else if (a == "--port") ok = parse_num(a, next(i), 0, 65535, cfg.port, err);
        else if (a == "--worker-bin") { cfg.worker_bin = next(i); ok = !cfg.worker_bin.empty(); if (!ok) err = "--worker-bin needs a value"; }
        else if (a == "--transcribe-workers") ok = parse_num(a, next(i), 0, 64, cfg.transcribe_workers, err);
        else if (a == "--generate-workers") ok = parse_num(a, next(i), 0, 64, cfg.generate_workers, err);
        else if (a == "--synthesize-workers") ok = parse_num(a, next(i), 0, 64, cfg.synthesize_workers, err);
        else if (a == "--clone-workers") ok = parse_num(a, next(i), 0, 64, cfg.clone_workers, err);
        else if (a == "--vad-workers") ok = parse_num(a, next(i), 0, 64, cfg.vad_workers, err);
        else if (a == "--vad-model") cfg.vad_model = next(i);
        else if (a == "--health-interval-ms") ok = parse_num(a, next(i), 10, kMaxMs, cfg.health_interval_ms, err);
        else if (a == "--ping-timeout-ms") ok = parse_num(a, next(i), 10, kMaxMs, cfg.ping_timeout_ms, err);
        else if (a == "--startup-timeout-ms") ok = parse_num(a, next(i), 10, kMaxMs, cfg.startup_timeout_ms, err);
        else if (a == "--max-restarts") ok = parse_num(a, next(i), 0, 1000, cfg.max_restarts, err);
        else if (a == "--restart-window-ms") ok = parse_num(a, next(i), 1, kMaxMs, cfg.restart_window_ms, err);
        else if (a == "--shutdown-grace-ms") ok = parse_num(a, next(i), 0, kMaxMs, cfg.shutdown_grace_ms, err);
        else if (a == "--task-deadline-ms") ok = parse_num(a, next(i), 0, kMaxMs, cfg.task_deadline_ms, err);
        else if (a == "--idle-timeout-ms") ok = parse_num(a, next(i), 1000, kMaxMs, cfg.idle_timeout_ms, err);
        else if (a == "--utterance-gap-ms") ok = parse_num(a, next(i), 20, 10000, cfg.utterance_gap_ms, err);
        else if (a == "--silence-rms") ok = parse_num(a, next(i), 0, 32767, cfg.silence_rms, err);
        else if (a == "--max-context-turns") ok = parse_num(a, next(i), 1, 10000, cfg.max_context_turns, err);
        else if (a == "--metrics-capacity") ok = parse_num(a, next(i), 1, 10000000, cfg.metrics_capacity, err);
        else if (a == "--metrics-export") cfg.metrics_export = next(i);
        else if (a == "--stats-interval-s") ok = parse_num(a, next(i), 0, 86400, cfg.stats_interval_s, err);
        else {
            err = "unknown argument " + a;
            return false;
        }
        if (!ok) return false;
    }
    return true;
}

std::string executable_dir() {
    char buf[PATH_MAX];
    ssize_t n = ::readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (n <= 0) return ".";
    std::string path(buf, static_cast<size_t>(n));
    auto slash = path.rfind('/');
    return slash == std::string::npos ? "." : path.substr(0, slash);
}

PoolConfig pool_config_for(const PlatformConfig& cfg, TaskType type) {
    PoolConfig pc;
    pc.type = type;
    pc.worker_bin = cfg.worker_bin.empty() ? executable_dir() + "/voxpipe_worker" : cfg.worker_bin;
    pc.health_interval_ms = cfg.health_interval_ms;
    pc.ping_timeout_ms = cfg.ping_timeout_ms;
    pc.startup_timeout_ms = cfg.startup_timeout_ms;
    pc.max_restarts = cfg.max_restarts;
    pc.restart_window_ms = cfg.restart_window_ms;
    switch (type) {
    case TaskType::Transcribe: pc.workers = cfg.transcribe_workers; break;
    case TaskType::GenerateReply: pc.workers = cfg.generate_workers; break;
    case TaskType::Synthesize: pc.workers = cfg.synthesize_workers; break;
    case TaskType::CloneVoice: pc.workers = cfg.clone_workers; break;
    case TaskType::DetectVoiceActivity:
        pc.workers = cfg.vad_workers;
        if (!cfg.vad_model.empty()) pc.worker_args = {"--vad-model", cfg.vad_model};
        break;
    }
    return pc;
}

GatewayConfig gateway_config_for(const PlatformConfig& cfg) {
    GatewayConfig gc;
    gc.idle_timeout_ms = cfg.idle_timeout_ms;
    gc.max_context_turns = static_cast<size_t>(cfg.max_context_turns);
    gc.task_deadline_ms = cfg.task_deadline_ms;
    gc.utterance.gap_ms = cfg.utterance_gap_ms;
    gc.utterance.silence_rms = cfg.silence_rms;
    return gc;
}

} // namespace voxpipe
