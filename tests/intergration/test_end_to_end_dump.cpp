#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <cstdlib>
#include <ctime>
#include <simdjson.h>

namespace fs = std::filesystem;

static std::string env_or(const char* k, const char* defv) {
  const char* v = std::getenv(k);
  return (v && *v) ? std::string(v) : std::string(defv);
}

static std::uint64_t make_fixture(const fs::path& p) {
  std::ofstream out(p, std::ios::binary);
  out << "/*!40101 SET NAMES binary*/;\n";
  out << "INSERT INTO `users` VALUES\n";
  const std::uint64_t rows = 60000;
  for (std::uint64_t i = 0; i < rows; ++i) {
    out << "(" << i << ",'user_" << i << "','user_" << i << "@example.org')"
        << (i + 1 == rows ? ";\n" : ",\n");
  }
  return rows;
}

int main() {
  std::string bin = env_or("DR_READER_BIN", "/opt/dump-reader/bin/dump-reader");
  if (!fs::exists(bin)) { std::cerr << "[ERR] binary not found: " << bin << "\n"; return 2; }

  fs::path work = fs::temp_directory_path() / ("dr-it-" + std::to_string(std::time(nullptr)));
  fs::create_directories(work);
  fs::path in = work / "users.000000001.sql";
  const std::uint64_t rows = make_fixture(in);
  fs::path art = work / "artifacts";
  fs::path emit = work / "emit";

  std::string cmd = "\"" + bin + "\" --region-mb=1 --block-kb=64 --threads=3"
                    " --artifact-root=\"" + art.string() + "\""
                    " --emit-dir=\"" + emit.string() + "\""
                    " --slug-mode=basename --slug-len=64"
                    " --scan \"" + in.string() + "\" > \"" + (work / "run.log").string() + "\" 2>&1";
  int rc = std::system(cmd.c_str());
  if (rc != 0) {
    std::cerr << "[FAIL] dump-reader returned " << rc << " (see " << (work / "run.log") << ")\n";
    return 1;
  }

  fs::path runjson = art / in.filename() / "run.json";
  if (!fs::exists(runjson)) { std::cerr << "[FAIL] no run.json at " << runjson << "\n"; return 1; }

  simdjson::ondemand::parser p;
  auto json = simdjson::padded_string::load(runjson.string());
  auto doc = p.iterate(json);

  uint64_t stmts   = doc["statements"].get_uint64().value_or(0);
  uint64_t nrows   = doc["rows"].get_uint64().value_or(0);
  uint64_t regions = doc["regions"].get_uint64().value_or(0);
  uint64_t fsize   = doc["file_size"].get_uint64().value_or(0);
  std::string_view header = doc["header"].get_string().value_or("");

  bool ok = true;
  if (stmts == 0) { std::cerr << "[FAIL] statements==0\n"; ok = false; }
  if (nrows != rows) { std::cerr << "[FAIL] rows " << nrows << " != " << rows << "\n"; ok = false; }
  if (regions < 2) { std::cerr << "[FAIL] expected several regions, got " << regions << "\n"; ok = false; }
  if (fsize != fs::file_size(in)) { std::cerr << "[FAIL] file_size mismatch\n"; ok = false; }
  if (header != "INSERT INTO `users` VALUES") { std::cerr << "[FAIL] header: " << header << "\n"; ok = false; }

  // every emitted line is a complete statement; together they hold every row once
  std::uint64_t emitted_rows = 0, emitted_stmts = 0;
  for (auto& e : fs::directory_iterator(emit)) {
    std::ifstream sql(e.path(), std::ios::binary);
    std::string line;
    while (std::getline(sql, line)) {
      ++emitted_stmts;
      if (line.rfind("INSERT INTO `users` VALUES(", 0) != 0 || line.back() != ';') {
        std::cerr << "[FAIL] bad statement in " << e.path() << "\n"; ok = false; break;
      }
      for (char c : line) if (c == '(') ++emitted_rows;
    }
  }
  if (emitted_rows != rows) { std::cerr << "[FAIL] emitted rows " << emitted_rows << "\n"; ok = false; }
  if (emitted_stmts != stmts) { std::cerr << "[FAIL] emitted statements " << emitted_stmts << "\n"; ok = false; }

  if (!ok) return 1;
  fs::remove_all(work);
  std::cout << "[PASS] end-to-end dump: regions=" << regions << " statements=" << stmts
            << " rows=" << nrows << "\n";
  return 0;
}
