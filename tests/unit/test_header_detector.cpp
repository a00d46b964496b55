#include "dump_reader/header_detector.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

static int failures = 0;

static void expect(bool ok, const std::string& what) {
  if (!ok) { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

static fs::path write_fixture(const std::string& name, const std::string& body) {
  fs::path p = fs::temp_directory_path() / name;
  std::ofstream o(p, std::ios::binary);
  o << body;
  return p;
}

int main() {
  auto h = dr::match_insert_header("INSERT INTO `t` VALUES\n");
  expect(h && *h == "INSERT INTO `t` VALUES", "plain header");

  h = dr::match_insert_header("insert into t values");
  expect(h && *h == "insert into t values", "case-insensitive, text kept as written");

  h = dr::match_insert_header("INSERT INTO t (a,b) VALUES (1,2);");
  expect(h && *h == "INSERT INTO t (a,b) VALUES", "column list is part of the header");

  h = dr::match_insert_header("  /* x */ INSERT INTO t VALUES(1);");
  expect(h && *h == "INSERT INTO t VALUES", "match need not start the line");

  expect(!dr::match_insert_header("SELECT 1;"), "no header in select");
  expect(!dr::match_insert_header("(1,'INSERT INTO'),"), "no VALUES keyword");

  dr::LogSink quiet = [](dr::LogLevel, std::string_view) {};

  auto f = write_fixture("dr_test_header.sql",
                         "/*!40101 SET NAMES binary*/;\n"
                         "/*!40014 SET FOREIGN_KEY_CHECKS=0*/;\n"
                         "INSERT INTO `orders` VALUES\n"
                         "(1),\n"
                         "(2);\n");
  expect(dr::detect_insert_header(f.string(), 16, quiet) == "INSERT INTO `orders` VALUES",
         "header found after annotations with a tiny look-ahead");

  auto g = write_fixture("dr_test_noheader.sql", "(1),\n(2);\n");
  expect(dr::detect_insert_header(g.string(), 4096, quiet).empty(), "file without header");

  auto n = write_fixture("dr_test_noeol.sql", "INSERT INTO t VALUES (1);");
  expect(dr::detect_insert_header(n.string(), 4096, quiet) == "INSERT INTO t VALUES",
         "header on an unterminated last line");

  bool logged = false;
  dr::LogSink spy = [&](dr::LogLevel lv, std::string_view) { logged |= lv == dr::LogLevel::Error; };
  expect(dr::detect_insert_header((fs::temp_directory_path() / "dr_nope.sql").string(), 4096, spy).empty(),
         "missing file yields no header");
  expect(logged, "missing file is logged");

  fs::remove(f); fs::remove(g); fs::remove(n);
  if (failures) return 1;
  std::cout << "[PASS] header detector\n";
  return 0;
}
