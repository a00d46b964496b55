#pragma once
#include <cstdint>
#include <chrono>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace dr {

struct StageTiming {
  std::string name;
  std::uint64_t duration_ms = 0;
};

struct RunStats {
  std::uint64_t statements = 0;
  std::uint64_t rows = 0;
  std::uint64_t bytes = 0;
  double throughput_mb_s = 0.0;
  double statements_per_sec = 0.0;

  std::vector<StageTiming> stages;
  std::unordered_map<std::string, std::uint64_t> anomalies;
};

// Per-worker counters. Not synchronized: give each worker its own registry
// and merge() them after the workers join.
class MetricsRegistry {
public:
  void reset();
  void add_statement(std::uint64_t rows) noexcept { ++statements_; rows_ += rows; }
  void add_bytes(std::uint64_t b) noexcept { bytes_ += b; }

  void start_stage(std::string_view name);
  void end_stage(std::string_view name);

  void add_anomaly(std::string_view kind);
  std::uint64_t anomalies(std::string_view kind) const;

  void merge(const MetricsRegistry& other);

  std::uint64_t statements() const noexcept { return statements_; }
  std::uint64_t rows() const noexcept { return rows_; }
  std::uint64_t bytes() const noexcept { return bytes_; }

  RunStats snapshot(double wall_ms) const;

private:
  std::uint64_t statements_{0};
  std::uint64_t rows_{0};
  std::uint64_t bytes_{0};
  std::unordered_map<std::string, std::uint64_t> anomalies_;
  std::unordered_map<std::string, std::uint64_t> stage_accum_ms_;
  std::unordered_map<std::string, std::chrono::steady_clock::time_point> stage_starts_;
};

}
