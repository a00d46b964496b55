#include "dump_reader/metrics.hpp"
#include <chrono>

namespace dr {

void MetricsRegistry::reset() {
  statements_ = rows_ = bytes_ = 0;
  anomalies_.clear();
  stage_accum_ms_.clear();
  stage_starts_.clear();
}

void MetricsRegistry::start_stage(std::string_view name) {
  stage_starts_[std::string(name)] = std::chrono::steady_clock::now();
}

void MetricsRegistry::end_stage(std::string_view name) {
  auto key = std::string(name);
  auto it = stage_starts_.find(key);
  if (it == stage_starts_.end()) return;
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
              std::chrono::steady_clock::now() - it->second).count();
  stage_accum_ms_[key] += static_cast<std::uint64_t>(ms);
  stage_starts_.erase(it);
}

void MetricsRegistry::add_anomaly(std::string_view kind) {
  ++anomalies_[std::string(kind)];
}

std::uint64_t MetricsRegistry::anomalies(std::string_view kind) const {
  auto it = anomalies_.find(std::string(kind));
  return it == anomalies_.end() ? 0 : it->second;
}

void MetricsRegistry::merge(const MetricsRegistry& other) {
  statements_ += other.statements_;
  rows_ += other.rows_;
  bytes_ += other.bytes_;
  for (auto& kv : other.anomalies_) anomalies_[kv.first] += kv.second;
  for (auto& kv : other.stage_accum_ms_) stage_accum_ms_[kv.first] += kv.second;
}

RunStats MetricsRegistry::snapshot(double wall_ms) const {
  RunStats r;
  r.statements = statements_;
  r.rows = rows_;
  r.bytes = bytes_;
  const double sec = wall_ms / 1000.0;
  r.throughput_mb_s = (sec > 0.0) ? (bytes_ / (1024.0*1024.0)) / sec : 0.0;
  r.statements_per_sec = (sec > 0.0) ? statements_ / sec : 0.0;

  r.anomalies = anomalies_;
  r.stages.reserve(stage_accum_ms_.size());
  for (auto& kv : stage_accum_ms_) r.stages.push_back(StageTiming{kv.first, kv.second});
  return r;
}

}
