#pragma once
#include <json/json.h>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace voxpipe {

// One pipeline turn. Stage spans are -1 when the stage did not run.
struct TurnRecord {
    std::string session_id;
    int turn = 0;
    int64_t started_at_ms = 0;  // wall clock, ms since epoch
    int64_t stt_ms = -1;
    int64_t generate_ms = -1;
    int64_t tts_ms = -1;
    int64_t e2e_ms = -1;        // utterance boundary to first audio byte (or reply, text-only)
    bool completed = false;
    bool cancelled = false;
    bool failed = false;
    std::string failed_stage;
};

struct StageSummary {
    size_t count = 0;
    double mean = 0.0;
    double p95 = 0.0;
};

struct MetricsSummary {
    size_t turns = 0;
    size_t completed = 0;
    size_t cancelled = 0;
    size_t failed = 0;
    uint64_t evicted = 0;
    StageSummary stt;
    StageSummary generate;
    StageSummary tts;
    StageSummary e2e;
    size_t feedback_count = 0;
    double feedback_mean = 0.0;
    std::map<std::string, size_t> feedback_by_category;
};

// Fixed-capacity ring of turn records. Records are only ever removed by
// overwriting the oldest one.
class MetricsAggregator {
public:
    explicit MetricsAggregator(size_t capacity = 1000);

    void record(const TurnRecord& r);
    void record_feedback(const std::string& session_id, double score, const std::string& category);

    MetricsSummary summary() const;
    // Oldest first.
    std::vector<TurnRecord> snapshot() const;

    Json::Value export_json() const;
    std::string export_csv() const;
    // CSV when the path ends in ".csv", JSON otherwise.
    bool export_to_file(const std::string& path, std::string& err) const;

    size_t size() const;
    size_t capacity() const { return capacity_; }

    static Json::Value to_json(const MetricsSummary& s);

private:
    const size_t capacity_;
    mutable std::mutex mtx_;
    std::vector<TurnRecord> ring_;
    size_t head_ = 0;      // next write position
    uint64_t recorded_ = 0;
    size_t feedback_count_ = 0;
    double feedback_sum_ = 0.0;
    std::map<std::string, size_t> feedback_by_category_;
};

} // namespace voxpipe
