#include "dump_reader/encoding.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

static int failures = 0;

static void expect(bool ok, const std::string& what) {
  if (!ok) { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

int main() {
  const std::string nihao_utf8 = "\xE4\xBD\xA0\xE5\xA5\xBD"; // 你好
  const std::string nihao_gb   = "\xC4\xE3\xBA\xC3";

  std::string out, err;

  const std::string raw("\xFF\x00\x01", 3);
  expect(dr::normalize_encoding(raw, "binary", out) == dr::Status::Ok && out == raw,
         "binary passes through");

  expect(dr::normalize_encoding(nihao_utf8, "utf8mb4", out) == dr::Status::Ok &&
         out == nihao_utf8, "utf8mb4 keeps valid UTF-8");
  expect(dr::normalize_encoding(nihao_gb, "utf8mb4", out, &err) == dr::Status::InvalidEncoding,
         "utf8mb4 rejects non UTF-8");

  expect(dr::normalize_encoding(nihao_utf8, "auto", out) == dr::Status::Ok &&
         out == nihao_utf8, "auto keeps valid UTF-8");
  expect(dr::normalize_encoding(nihao_gb, "auto", out) == dr::Status::Ok &&
         out == nihao_utf8, "auto falls back to GB18030");

  expect(dr::normalize_encoding(nihao_gb, "gb18030", out) == dr::Status::Ok &&
         out == nihao_utf8, "gb18030 decodes");
  expect(dr::normalize_encoding("\x81\x20", "gb18030", out, &err) == dr::Status::InvalidEncoding,
         "gb18030 illegal sequence");
  expect(dr::normalize_encoding("ab\xC4", "gb18030", out, &err) == dr::Status::InvalidEncoding,
         "gb18030 truncated sequence");
  // GB18030 four-byte form of U+FFFD
  expect(dr::normalize_encoding("\x84\x31\xA4\x37", "gb18030", out, &err) == dr::Status::InvalidEncoding,
         "decoded U+FFFD is rejected");

  err.clear();
  expect(dr::normalize_encoding("x", "latin1", out, &err) == dr::Status::UnsupportedEncoding,
         "unknown charset");
  expect(err.find("latin1") != std::string::npos, "error names the charset: " + err);

  // schema export: annotations dropped, lines trimmed and joined
  const fs::path f = fs::temp_directory_path() / "dr_test_schema.sql";
  {
    std::ofstream o(f, std::ios::binary);
    o << "/*!40101 SET NAMES binary*/;\n"
      << "\n"
      << "CREATE TABLE `t` (\n"
      << "  `id` int,\n"
      << "  `name` varchar(8) COMMENT '" << nihao_gb << "'\n"
      << ");\n";
  }
  std::string text;
  dr::LogSink quiet = [](dr::LogLevel, std::string_view) {};
  expect(dr::load_schema_statement(f.string(), "utf8mb4", text, quiet, &err) ==
           dr::Status::InvalidEncoding, "schema in GBK is not utf8mb4");
  expect(err.find("failed to decode") != std::string::npos, "decode error annotated: " + err);

  expect(dr::load_schema_statement(f.string(), "auto", text, quiet, &err) == dr::Status::Ok,
         "schema decodes with auto");
  const std::string want = "CREATE TABLE `t` (\n`id` int,\n`name` varchar(8) COMMENT '" +
                           nihao_utf8 + "'\n);";
  expect(text == want, "schema text: " + text);

  expect(dr::load_schema_statement((fs::temp_directory_path() / "dr_missing.sql").string(),
                                   "auto", text, quiet, &err) == dr::Status::IoError,
         "missing schema file");

  fs::remove(f);
  if (failures) return 1;
  std::cout << "[PASS] encoding normalizer\n";
  return 0;
}
