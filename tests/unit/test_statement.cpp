#include "dump_reader/statement.hpp"
#include <iostream>
#include <string>
#include <vector>

static int failures = 0;

static void expect(bool ok, const std::string& what) {
  if (!ok) { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

int main() {
  const std::string H = "INSERT INTO t VALUES";

  expect(dr::trim("  (1),\r\n") == "(1),", "trim strips CR/LF and spaces");
  expect(dr::trim(" \t\n").empty(), "trim of blank is empty");

  expect(dr::is_annotation_block("/*!40101 SET NAMES binary*/;"), "annotation block");
  expect(!dr::is_annotation_block("/* no terminator */"), "comment without ';' is not a block");
  expect(dr::is_comment_line("/* comment */"), "bare comment line");
  expect(dr::is_comment_line("/* comment */;"), "comment line with ';'");
  expect(!dr::is_comment_line("/* opens here"), "multi-line comment opener is content");
  expect(!dr::is_comment_line("(1,'/* x */'),"), "comment text inside a row");

  expect(dr::count_rows("(1),") == 1, "one row per line");
  expect(dr::count_rows(" (1,'a'),(2,'b'),(3,NULL);") == 3, "several rows on one line");
  expect(dr::count_rows("(1,'),(x'),(2,(3));") == 2, "separators inside strings and nesting ignored");
  expect(dr::count_rows("(1,'it''s'),(2,'\\''),(3);") == 3, "quote escapes");
  expect(dr::count_rows("") == 0 && dr::count_rows("'tail of a row'),") == 0, "no tuple opened");

  {
    std::string s = "  INSERT INTO t VALUES(1),(2),\n";
    expect(dr::finalize_statement(s, H) == dr::StatementCheck::Ok, "trailing comma accepted");
    expect(s == "INSERT INTO t VALUES(1),(2);", "trailing comma rewritten: " + s);
  }
  {
    std::string s = "INSERT INTO t VALUES(1);";
    expect(dr::finalize_statement(s, H) == dr::StatementCheck::Ok, "complete statement");
    expect(s == "INSERT INTO t VALUES(1);", "complete statement untouched");
  }
  {
    std::string s = "INSERT INTO t VALUES";
    expect(dr::finalize_statement(s, H) == dr::StatementCheck::Empty, "header alone is empty");
    std::string blank = " \n";
    expect(dr::finalize_statement(blank, H) == dr::StatementCheck::Empty, "blank is empty");
  }
  {
    std::string s = "UPDATE t SET a=1;";
    expect(dr::finalize_statement(s, H) == dr::StatementCheck::BadStart, "foreign start rejected");
  }
  {
    std::string s = "INSERT INTO t VALUES(1),(2";
    expect(dr::finalize_statement(s, H) == dr::StatementCheck::BadEnd, "cut row rejected");
  }

  // a malformed candidate is dropped, its neighbours survive
  {
    std::vector<std::string> candidates = {
      "INSERT INTO t VALUES(1),",
      "garbage (2) x",
      "INSERT INTO t VALUES(3);",
    };
    std::vector<std::string> emitted;
    for (auto& c : candidates)
      if (dr::finalize_statement(c, H) == dr::StatementCheck::Ok) emitted.push_back(c);
    expect(emitted.size() == 2, "two of three emitted");
    expect(emitted.size() == 2 && emitted[0] == "INSERT INTO t VALUES(1);" &&
           emitted[1] == "INSERT INTO t VALUES(3);", "survivors keep order");
  }

  expect(dr::head_excerpt("INSERT INTO t") == "INSERT INT", "head excerpt");
  expect(dr::tail_excerpt("abc") == "abc", "short tail excerpt");

  if (failures) return 1;
  std::cout << "[PASS] statement helpers\n";
  return 0;
}
