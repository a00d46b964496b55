#include "dump_reader/artifact_writer.hpp"
#include "dump_reader/encoding.hpp"
#include "dump_reader/line_buffer.hpp"
#include "dump_reader/log.hpp"
#include "dump_reader/metrics.hpp"
#include "dump_reader/path_utils.hpp"
#include "dump_reader/region_reader.hpp"
#include "dump_reader/run_json.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include <sys/types.h>

namespace {

struct Cli {
  std::string artifact_root = "artifacts/dump-reader";
  std::string slug_mode = "hashprefix"; // hashprefix|basename|keypath
  int slug_len = 8;
  int region_mb = 256;
  int block_kb = 1024;
  int threads = 0;                      // 0 = hardware concurrency
  bool verbose = false;
  std::string emit_dir;                 // empty = don't write statements
  std::string schema;
  std::string charset = "auto";
  std::vector<std::string> scans;       // explicit file paths
};

Cli parse_cli(int argc, char** argv) {
  Cli c;
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto eat = [&](const char* pfx, std::string* out){
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    auto eat_i = [&](const char* pfx, int* out){
      if (a.rfind(pfx, 0) == 0) { *out = std::stoi(a.substr(std::string(pfx).size())); return true; }
      return false;
    };
    if (eat("--artifact-root=", &c.artifact_root)) continue;
    if (eat("--slug-mode=", &c.slug_mode)) continue;
    if (eat_i("--slug-len=", &c.slug_len)) continue;
    if (eat_i("--region-mb=", &c.region_mb)) continue;
    if (eat_i("--block-kb=", &c.block_kb)) continue;
    if (eat_i("--threads=", &c.threads)) continue;
    if (eat("--emit-dir=", &c.emit_dir)) continue;
    if (eat("--schema=", &c.schema)) continue;
    if (eat("--charset=", &c.charset)) continue;
    if (a == "-v" || a == "--verbose") { c.verbose = true; continue; }
    if (a == "--scan" && i+1 < argc) { c.scans.push_back(argv[++i]); continue; }
    if (a.rfind("--scan=",0)==0) { c.scans.push_back(a.substr(7)); continue; }
    if (a == "-h" || a == "--help") {
      std::cout <<
        "Usage: dump-reader [--scan <file>|--scan=<file>] [--region-mb=N] [--block-kb=N]\n"
        "                   [--threads=N] [--emit-dir=DIR] [--schema=FILE] [--charset=NAME]\n"
        "                   [--artifact-root=DIR] [--slug-mode=hashprefix|basename|keypath]\n"
        "                   [--slug-len=N] [-v]\n";
      std::exit(0);
    }
    std::cerr << "[cli] ignoring unknown argument: " << a << "\n";
  }
  if (c.region_mb < 1) c.region_mb = 1;
  if (c.block_kb < 1) c.block_kb = 1;
  return c;
}

struct Region {
  std::int64_t offset = 0;
  std::int64_t size = 0;
};

// Even byte split, each cut moved forward to the next line start. Stand-in
// for the loader's planner, which owns region boundaries in production.
bool plan_regions(const std::string& path, std::int64_t file_size,
                  std::int64_t region_bytes, std::vector<Region>& out, std::string* err) {
  std::FILE* f = std::fopen(path.c_str(), "rb");
  if (!f) { if (err) *err = "open failed: " + path; return false; }

  dr::LineBuffer lb(4096);
  std::vector<std::int64_t> cuts{0};
  for (std::int64_t b = region_bytes; b < file_size; b += region_bytes) {
    if (b <= cuts.back()) continue;
    if (::fseeko(f, static_cast<off_t>(b - 1), SEEK_SET) != 0) {
      if (err) *err = "seek failed: " + path;
      std::fclose(f);
      return false;
    }
    lb.reset();
    std::string sink;
    bool io_error = false;
    std::size_t n = lb.read_line(f, sink, io_error, /*limit=*/1);
    if (io_error) { if (err) *err = "read failed: " + path; std::fclose(f); return false; }
    std::int64_t cut = b - 1 + static_cast<std::int64_t>(n);
    if (cut > cuts.back() && cut < file_size) cuts.push_back(cut);
  }
  std::fclose(f);

  cuts.push_back(file_size);
  for (std::size_t i = 0; i + 1 < cuts.size(); ++i)
    out.push_back(Region{cuts[i], cuts[i+1] - cuts[i]});
  return true;
}

std::string make_slug_for(const std::string& path, const std::string& mode, int len) {
  // For hashprefix mode, hash the full absolute path to be stable across cwd.
  std::string key = (mode == "hashprefix")
      ? std::filesystem::weakly_canonical(std::filesystem::path(path)).string()
      : path;
  return dr::make_slug(key, mode, len);
}

struct RegionResult {
  dr::RunJsonRegion stats;
  dr::Status status = dr::Status::Ok;
  std::string error;
  std::string header;
};

void read_region(const std::string& filepath, const Region& rg, std::size_t index,
                 const Cli& cli, const std::string& slug, const dr::LogSink& log,
                 dr::MetricsRegistry& metrics, RegionResult& res) {
  namespace ch = std::chrono;
  const auto t0 = ch::steady_clock::now();
  res.stats.offset = rg.offset;
  res.stats.size = rg.size;

  std::ofstream emit;
  if (!cli.emit_dir.empty()) {
    auto p = std::filesystem::path(cli.emit_dir) / (slug + "." + std::to_string(index) + ".sql");
    if (dr::ensure_parent_dirs(p)) emit.open(p, std::ios::binary);
    if (!emit.is_open()) {
      res.status = dr::Status::IoError;
      res.error = "cannot open " + p.string();
      return;
    }
  }

  dr::StatementReader::Config rcfg;
  dr::RegionReader reader(filepath, rg.offset, rg.size, rcfg, log, &metrics);
  res.status = reader.open();
  if (res.status != dr::Status::Ok) { res.error = reader.error(); return; }
  res.header = reader.file_reader().header();

  const std::uint64_t before_stmts = metrics.statements();
  const std::uint64_t before_bytes = metrics.bytes();
  const std::int64_t block = static_cast<std::int64_t>(cli.block_kb) * 1024;
  std::vector<std::string> batch;
  while (true) {
    batch.clear();
    dr::Status st = reader.read(block, batch);
    if (st == dr::Status::EndOfFile) break;
    if (dr::is_fatal(st)) { res.status = st; res.error = reader.error(); break; }
    if (emit.is_open()) {
      for (auto& s : batch) { emit.write(s.data(), static_cast<std::streamsize>(s.size())); emit.put('\n'); }
    }
  }
  if (!reader.close()) log(dr::LogLevel::Warn, "close failed: " + reader.error());

  res.stats.statements = metrics.statements() - before_stmts;
  res.stats.bytes = metrics.bytes() - before_bytes;
  res.stats.wall_ms = ch::duration<double, std::milli>(ch::steady_clock::now() - t0).count();
}

int scan_one_file(const std::string& filepath, const Cli& cli, const dr::LogSink& log) {
  namespace ch = std::chrono;
  const auto t0 = ch::steady_clock::now();

  std::error_code fec;
  const auto file_size = static_cast<std::int64_t>(std::filesystem::file_size(filepath, fec));
  if (fec) {
    std::cerr << "[scan] cannot stat " << filepath << ": " << fec.message() << "\n";
    return 3;
  }

  dr::MetricsRegistry total;
  total.start_stage("plan");
  std::vector<Region> regions;
  std::string err;
  if (!plan_regions(filepath, file_size, static_cast<std::int64_t>(cli.region_mb) << 20, regions, &err)) {
    std::cerr << "[scan] " << err << "\n";
    return 3;
  }
  total.end_stage("plan");

  const std::string slug = make_slug_for(filepath, cli.slug_mode, cli.slug_len);

  // --- one reader, one handle, one registry per region
  total.start_stage("read");
  std::vector<RegionResult> results(regions.size());
  std::vector<dr::MetricsRegistry> worker_metrics(regions.size());
  std::atomic<std::size_t> next{0};
  unsigned nthreads = cli.threads > 0 ? static_cast<unsigned>(cli.threads)
                                      : std::max(1u, std::thread::hardware_concurrency());
  nthreads = std::min<unsigned>(nthreads, static_cast<unsigned>(std::max<std::size_t>(1, regions.size())));

  std::vector<std::thread> pool;
  for (unsigned t = 0; t < nthreads; ++t) {
    pool.emplace_back([&]{
      for (std::size_t i = next.fetch_add(1); i < regions.size(); i = next.fetch_add(1))
        read_region(filepath, regions[i], i, cli, slug, log, worker_metrics[i], results[i]);
    });
  }
  for (auto& th : pool) th.join();
  for (auto& m : worker_metrics) total.merge(m);
  total.end_stage("read");

  int rc = 0;
  std::string header;
  for (std::size_t i = 0; i < results.size(); ++i) {
    if (dr::is_fatal(results[i].status)) {
      std::cerr << "[scan] region " << i << " @" << regions[i].offset << " failed: "
                << dr::status_name(results[i].status) << ": " << results[i].error << "\n";
      rc = 3;
    }
  }
  for (auto& r : results) if (header.empty()) header = r.header;

  const double wall_ms = ch::duration<double, std::milli>(ch::steady_clock::now() - t0).count();
  const dr::RunStats stats = total.snapshot(wall_ms);

  dr::RunJsonPayload p{};
  p.statements = stats.statements;
  p.rows = stats.rows;
  p.bytes = stats.bytes;
  p.wall_time_ms = wall_ms;
  p.throughput_mb_s = stats.throughput_mb_s;
  p.statements_per_sec = stats.statements_per_sec;
  p.regions = regions.size();
  for (auto& s : stats.stages) p.stage_times.emplace_back(s.name, s.duration_ms);
  p.anomalies = stats.anomalies;
  for (auto& r : results) p.series.push_back(r.stats);
  p.filename = filepath;
  p.header = header;
  p.file_size = static_cast<std::uint64_t>(file_size);

  std::string run_json = dr::RunJsonWriter::to_json(p);
  if (!dr::write_run_artifact(cli.artifact_root, slug, run_json, &err)) {
    std::cerr << "[scan] write_run_artifact failed: " << err << "\n";
    return 2;
  }

  std::cout << "[scan] " << (rc == 0 ? "ok" : "failed") << ": " << filepath
            << " regions=" << regions.size() << " statements=" << stats.statements
            << " -> " << cli.artifact_root << "/" << slug << "/run.json\n";
  return rc;
}

int load_schema(const Cli& cli, const dr::LogSink& log) {
  std::string text, err;
  dr::Status st = dr::load_schema_statement(cli.schema, cli.charset, text, log, &err);
  if (st != dr::Status::Ok) {
    std::cerr << "[schema] " << dr::status_name(st) << ": " << err << "\n";
    return 3;
  }
  std::cout << "[schema] ok: " << cli.schema << " (" << text.size() << " bytes as "
            << cli.charset << ")\n";
  return 0;
}

}

int main(int argc, char** argv) {
  auto cli = parse_cli(argc, argv);
  dr::LogSink log = dr::default_log_sink(cli.verbose);

  int rc = 0;
  if (!cli.schema.empty()) rc = std::max(rc, load_schema(cli, log));
  for (const auto& f : cli.scans) rc = std::max(rc, scan_one_file(f, cli, log));

  if (cli.scans.empty() && cli.schema.empty()) {
    std::cerr << "nothing to do (try --help)\n";
    return 1;
  }
  return rc;
}
