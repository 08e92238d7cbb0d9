#include "metrics_aggregator.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>
#include <sstream>

namespace voxpipe {

namespace {

StageSummary summarize(std::vector<int64_t> values) {
    StageSummary s;
    if (values.empty()) return s;
    std::sort(values.begin(), values.end());
    double sum = 0.0;
    for (int64_t v : values) sum += static_cast<double>(v);
    s.count = values.size();
    s.mean = sum / static_cast<double>(values.size());
    // nearest rank
    size_t rank = static_cast<size_t>(std::ceil(0.95 * static_cast<double>(values.size())));
    if (rank == 0) rank = 1;
    s.p95 = static_cast<double>(values[rank - 1]);
    return s;
}

Json::Value stage_json(const StageSummary& s) {
    Json::Value v;
    v["count"] = static_cast<Json::UInt64>(s.count);
    v["mean"] = s.mean;
    v["p95"] = s.p95;
    return v;
}

Json::Value record_json(const TurnRecord& r) {
    Json::Value v;
    v["session_id"] = r.session_id;
    v["turn"] = r.turn;
    v["started_at_ms"] = static_cast<Json::Int64>(r.started_at_ms);
    v["stt_ms"] = static_cast<Json::Int64>(r.stt_ms);
    v["generate_ms"] = static_cast<Json::Int64>(r.generate_ms);
    v["tts_ms"] = static_cast<Json::Int64>(r.tts_ms);
    v["e2e_ms"] = static_cast<Json::Int64>(r.e2e_ms);
    v["completed"] = r.completed;
    v["cancelled"] = r.cancelled;
    v["failed"] = r.failed;
    v["failed_stage"] = r.failed_stage;
    return v;
}

} // namespace

MetricsAggregator::MetricsAggregator(size_t capacity) : capacity_(capacity > 0 ? capacity : 1) {
    ring_.reserve(capacity_);
}

void MetricsAggregator::record(const TurnRecord& r) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (ring_.size() < capacity_) {
        ring_.push_back(r);
    } else {
        ring_[head_] = r;
    }
    head_ = (head_ + 1) % capacity_;
    ++recorded_;
}

void MetricsAggregator::record_feedback(const std::string& session_id, double score, const std::string& category) {
    std::lock_guard<std::mutex> lk(mtx_);
    ++feedback_count_;
    feedback_sum_ += score;
    ++feedback_by_category_[category.empty() ? "general" : category];
    std::cout << "[Metrics] QUALITY_FEEDBACK session=" << session_id << " score=" << score
              << " category=" << (category.empty() ? "general" : category) << "\n";
}

std::vector<TurnRecord> MetricsAggregator::snapshot() const {
    std::lock_guard<std::mutex> lk(mtx_);
    std::vector<TurnRecord> out;
    out.reserve(ring_.size());
    if (ring_.size() < capacity_) {
        out = ring_;
    } else {
        for (size_t i = 0; i < capacity_; ++i) out.push_back(ring_[(head_ + i) % capacity_]);
    }
    return out;
}

size_t MetricsAggregator::size() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return ring_.size();
}

MetricsSummary MetricsAggregator::summary() const {
    std::vector<TurnRecord> records = snapshot();
    MetricsSummary s;
    std::vector<int64_t> stt, gen, tts, e2e;
    for (const auto& r : records) {
        ++s.turns;
        if (r.completed) ++s.completed;
        if (r.cancelled) ++s.cancelled;
        if (r.failed) ++s.failed;
        if (r.stt_ms >= 0) stt.push_back(r.stt_ms);
        if (r.generate_ms >= 0) gen.push_back(r.generate_ms);
        if (r.tts_ms >= 0) tts.push_back(r.tts_ms);
        if (r.e2e_ms >= 0) e2e.push_back(r.e2e_ms);
    }
    s.stt = summarize(std::move(stt));
    s.generate = summarize(std::move(gen));
    s.tts = summarize(std::move(tts));
    s.e2e = summarize(std::move(e2e));

    std::lock_guard<std::mutex> lk(mtx_);
    s.evicted = recorded_ - ring_.size();
    s.feedback_count = feedback_count_;
    s.feedback_mean = feedback_count_ ? feedback_sum_ / static_cast<double>(feedback_count_) : 0.0;
    s.feedback_by_category = feedback_by_category_;
    return s;
}

Json::Value MetricsAggregator::to_json(const MetricsSummary& s) {
    Json::Value v;
    v["turns"] = static_cast<Json::UInt64>(s.turns);
    v["completed"] = static_cast<Json::UInt64>(s.completed);
    v["cancelled"] = static_cast<Json::UInt64>(s.cancelled);
    v["failed"] = static_cast<Json::UInt64>(s.failed);
    v["evicted"] = static_cast<Json::UInt64>(s.evicted);
    v["stages"]["stt"] = stage_json(s.stt);
    v["stages"]["generate"] = stage_json(s.generate);
    v["stages"]["tts"] = stage_json(s.tts);
    v["stages"]["e2e"] = stage_json(s.e2e);
    v["feedback"]["count"] = static_cast<Json::UInt64>(s.feedback_count);
    v["feedback"]["mean_score"] = s.feedback_mean;
    for (const auto& kv : s.feedback_by_category) {
        v["feedback"]["categories"][kv.first] = static_cast<Json::UInt64>(kv.second);
    }
    return v;
}

Json::Value MetricsAggregator::export_json() const {
    Json::Value arr(Json::arrayValue);
    for (const auto& r : snapshot()) arr.append(record_json(r));
    return arr;
}

std::string MetricsAggregator::export_csv() const {
    std::ostringstream os;
    os << "session_id,turn,started_at_ms,stt_ms,generate_ms,tts_ms,e2e_ms,completed,cancelled,failed,failed_stage\n";
    for (const auto& r : snapshot()) {
        os << r.session_id << ',' << r.turn << ',' << r.started_at_ms << ','
           << r.stt_ms << ',' << r.generate_ms << ',' << r.tts_ms << ',' << r.e2e_ms << ','
           << (r.completed ? 1 : 0) << ',' << (r.cancelled ? 1 : 0) << ',' << (r.failed ? 1 : 0) << ','
           << r.failed_stage << '\n';
    }
    return os.str();
}

bool MetricsAggregator::export_to_file(const std::string& path, std::string& err) const {
    std::ofstream f(path);
    if (!f) {
        err = "cannot open " + path;
        return false;
    }
    bool csv = path.size() >= 4 && path.compare(path.size() - 4, 4, ".csv") == 0;
    if (csv) {
        f << export_csv();
    } else {
        Json::StreamWriterBuilder builder;
        builder["indentation"] = "  ";
        f << Json::writeString(builder, export_json()) << "\n";
    }
    if (!f) {
        err = "write failed for " + path;
        return false;
    }
    return true;
}

} // namespace voxpipe
