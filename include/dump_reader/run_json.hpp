#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace dr {

struct RunJsonRegion {
  std::int64_t offset = 0;
  std::int64_t size = 0;
  std::uint64_t statements = 0;
  std::uint64_t bytes = 0;
  double wall_ms = 0.0;
};

struct RunJsonPayload {
  // Top-level KPIs
  std::uint64_t statements = 0;
  std::uint64_t rows = 0;
  std::uint64_t bytes = 0;
  double wall_time_ms = 0.0;
  double throughput_mb_s = 0.0;
  double statements_per_sec = 0.0;
  std::uint64_t regions = 0;

  // Stages and anomalies
  std::vector<std::pair<std::string, std::uint64_t>> stage_times;
  std::unordered_map<std::string, std::uint64_t> anomalies;

  // One entry per region, in file order
  std::vector<RunJsonRegion> series;

  // Input metadata
  std::string filename;
  std::string header;
  std::uint64_t file_size = 0;
};

class RunJsonWriter {
public:
  static std::string to_json(const RunJsonPayload& p);
};

}
