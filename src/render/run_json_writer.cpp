#include "dump_reader/run_json.hpp"
#include <cstdio>
#include <sstream>
#include <cmath> // std::isfinite

namespace dr {

static void esc(std::ostringstream& o, const std::string& s){
  o << '"';
  for (char c : s){
    switch(c){
      case '\\': o << "\\\\"; break;
      case '"':  o << "\\\""; break;
      case '\n': o << "\\n";  break;
      case '\r': o << "\\r";  break;
      case '\t': o << "\\t";  break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char u[8];
          std::snprintf(u, sizeof(u), "\\u%04x", static_cast<unsigned>(c));
          o << u;
        } else {
          o << c;
        }
        break;
    }
  }
  o << '"';
}

static inline double safe_num(double v){ return std::isfinite(v) ? v : 0.0; }

std::string RunJsonWriter::to_json(const RunJsonPayload& p) {
  std::ostringstream o;
  o << "{";
  o << "\"statements\":" << p.statements << ",";
  o << "\"rows\":" << p.rows << ",";
  o << "\"bytes\":" << p.bytes << ",";
  o << "\"wall_time_ms\":" << safe_num(p.wall_time_ms) << ",";
  o << "\"throughput_mb_s\":" << safe_num(p.throughput_mb_s) << ",";
  o << "\"statements_per_sec\":" << safe_num(p.statements_per_sec) << ",";
  o << "\"regions\":" << p.regions << ",";

  o << "\"stage_times\":[";
  for (size_t i=0;i<p.stage_times.size();++i){
    if (i) o << ",";
    o << "{\"stage\":"; esc(o, p.stage_times[i].first);
    o << ",\"duration_ms\":" << p.stage_times[i].second << "}";
  }
  o << "],";

  o << "\"anomalies\":{";
  bool first=true;
  for (auto& kv : p.anomalies) {
    if (!first) o << ",";
    first=false;
    esc(o, kv.first); o << ":" << kv.second;
  }
  o << "},";

  o << "\"series\":[";
  for (size_t i=0;i<p.series.size();++i){
    if (i) o << ",";
    const auto& s = p.series[i];
    o << "{"
      << "\"offset\":"     << s.offset     << ","
      << "\"size\":"       << s.size       << ","
      << "\"statements\":" << s.statements << ","
      << "\"bytes\":"      << s.bytes      << ","
      << "\"wall_ms\":"    << safe_num(s.wall_ms)
      << "}";
  }
  o << "],";

  o << "\"filename\":"; esc(o, p.filename); o << ",";
  o << "\"header\":";   esc(o, p.header);   o << ",";
  o << "\"file_size\":" << p.file_size;

  o << "}";
  return o.str();
}

}
