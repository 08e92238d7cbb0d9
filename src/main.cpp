#include "config.hpp"
#include "gateway_server.hpp"
#include "metrics_aggregator.hpp"
#include "pool_registry.hpp"
#include "session_gateway.hpp"
#include <boost/asio.hpp>
#include <chrono>
#include <csignal>
#include <functional>
#include <iostream>

using namespace voxpipe;

namespace {

void log_stats(const SessionGateway& gateway, const MetricsAggregator& metrics, const PoolRegistry& registry) {
    GatewayStats gs = gateway.stats();
    MetricsSummary ms = metrics.summary();
    std::cout << "[main] STATS sessions=" << gs.active_sessions << " turns=" << ms.turns
              << " completed=" << ms.completed << " cancelled=" << ms.cancelled << " failed=" << ms.failed
              << " e2e_mean_ms=" << ms.e2e.mean << " e2e_p95_ms=" << ms.e2e.p95 << "\n";
    for (const PoolStatus& ps : registry.describe()) {
        std::cout << "[main] POOL type=" << to_string(ps.type) << " idle=" << ps.idle << " busy=" << ps.busy
                  << " unhealthy=" << ps.unhealthy << " queue=" << ps.queue_depth
                  << " restarts=" << ps.restarts << (ps.degraded ? " degraded" : "") << "\n";
    }
}

} // namespace

int main(int argc, char** argv) {
    PlatformConfig cfg;
    std::string err;
    bool help = false;
    if (!parse_platform_config(argc, argv, cfg, err, help)) {
        std::cerr << "[main] " << err << "\n" << platform_usage();
        return 2;
    }
    if (help) {
        std::cout << platform_usage();
        return 0;
    }

    try {
        PoolRegistry registry;
        const TaskType all[] = {TaskType::Transcribe, TaskType::GenerateReply, TaskType::Synthesize,
                                TaskType::CloneVoice, TaskType::DetectVoiceActivity};
        for (TaskType t : all) {
            PoolConfig pc = pool_config_for(cfg, t);
            if (pc.workers > 0) registry.add_pool(pc);
        }
        registry.validate({TaskType::Transcribe, TaskType::GenerateReply, TaskType::Synthesize});

        MetricsAggregator metrics(cfg.metrics_capacity);
        InMemoryContextStore contexts;
        SessionGateway gateway(registry, metrics, gateway_config_for(cfg), &contexts);
        gateway.start();

        boost::asio::io_context io;
        GatewayServer server(io, gateway, cfg.bind, static_cast<uint16_t>(cfg.port));
        server.start();

        boost::asio::steady_timer stats_timer(io);
        boost::asio::steady_timer drain_timer(io);
        std::function<void()> arm_stats = [&]() {
            if (cfg.stats_interval_s <= 0) return;
            stats_timer.expires_after(std::chrono::seconds(cfg.stats_interval_s));
            stats_timer.async_wait([&](const boost::system::error_code& ec) {
                if (ec) return;
                log_stats(gateway, metrics, registry);
                arm_stats();
            });
        };
        arm_stats();

        boost::asio::signal_set signals(io, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int signo) {
            if (ec) return;
            std::cout << "[main] SHUTDOWN signal=" << signo << "\n";
            server.stop();
            stats_timer.cancel();
            gateway.stop();
            // Let the "ended" frames reach their sockets.
            drain_timer.expires_after(std::chrono::seconds(1));
            drain_timer.async_wait([&](const boost::system::error_code&) { io.stop(); });
        });

        std::cout << "[main] READY port=" << server.port() << "\n";
        io.run();

        registry.shutdown(cfg.shutdown_grace_ms);
        log_stats(gateway, metrics, registry);
        if (!cfg.metrics_export.empty()) {
            std::string export_err;
            if (metrics.export_to_file(cfg.metrics_export, export_err)) {
                std::cout << "[main] METRICS_EXPORTED path=" << cfg.metrics_export << " records=" << metrics.size() << "\n";
            } else {
                std::cerr << "[main] METRICS_EXPORT_FAILED path=" << cfg.metrics_export << " err=" << export_err << "\n";
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[main] FATAL " << e.what() << "\n";
        return 1;
    }
    std::cout << "[main] exiting\n";
    return 0;
}
