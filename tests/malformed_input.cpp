#include "diffarena/arena.hpp"
#include "diffarena/parser.hpp"

#include <iostream>
#include <string>
#include <vector>

using namespace diffarena;

namespace {

ParseResult run(const std::string &text, StringInternPool &pool) {
  return parse_diff_string(text, ParserOptions{.pool = &pool});
}

} // namespace

int main() {
  StringInternPool pool;
  const std::string head = "diff --git a/m b/m\n--- a/m\n+++ b/m\n";

  // Unparsable counts: recorded, and the hunk takes every following line
  {
    const auto res = run(head + "@@ -a,b +c,d @@\n x\n+y\n-z\n", pool);
    const auto &an = res.stats.anomalies;
    if (an.malformed_hunk_headers != 1 || an.truncated_hunks != 0 || an.total() != 1 ||
        res.arena->hunk_count() != 1 || res.arena->line_count() != 3) {
      std::cerr << "malformed header handling wrong\n";
      return 1;
    }
  }

  // Input ends mid-hunk
  {
    const auto res = run(head + "@@ -1,5 +1,5 @@\n ctx\n", pool);
    if (res.stats.anomalies.truncated_hunks != 1 || res.arena->line_count() != 1) {
      std::cerr << "truncation not recorded\n";
      return 1;
    }
  }

  // Unknown prefix inside a hunk is kept as context
  {
    const auto res = run(head + "@@ -1,3 +1,3 @@\n a\n?weird\n b\n", pool);
    const auto &an = res.stats.anomalies;
    if (an.unrecognized_lines != 1 || an.total() != 1 || res.arena->line_count() != 3 ||
        res.arena->line_type(1) != LineType::Context ||
        res.arena->decode_line_content(1) != "?weird" || res.arena->line_new_number(2) != 3) {
      std::cerr << "unrecognized prefix handling wrong\n";
      return 1;
    }
  }

  // Content and hunk headers before any file header are dropped
  {
    const auto res = run("+orphan\n@@ -1 +1 @@\n-x\n", pool);
    if (res.stats.anomalies.stray_lines != 3 || res.arena->file_count() != 0 ||
        res.arena->line_count() != 0) {
      std::cerr << "stray lines: " << res.stats.anomalies.stray_lines << "\n";
      return 1;
    }
  }

  // More lines than the header announced: counted, not stored
  {
    const auto res = run(head + "@@ -1 +1 @@\n-x\n+y\n+z\n", pool);
    if (res.stats.anomalies.excess_lines != 1 || res.arena->line_count() != 2 ||
        res.arena->file_additions(0).size() != 1) {
      std::cerr << "excess lines not dropped\n";
      return 1;
    }
  }

  // git format-patch trailer after the last hunk is not a deletion
  {
    const auto res = run(head + "@@ -1,2 +1,1 @@\n keep\n-gone\n-- \n2.43.0\n\n", pool);
    if (res.arena->file_deletions(0).size() != 1 || res.arena->line_count() != 2 ||
        res.stats.anomalies.excess_lines != 1 || res.stats.anomalies.total() != 1) {
      std::cerr << "format-patch signature stored as content\n";
      return 1;
    }
  }

  // Header numbers that do not fit in 32 bits are malformed, not truncated
  {
    const auto res = run(head + "@@ -99999999999,1 +1 @@\n-a\n+b\n", pool);
    if (res.stats.anomalies.malformed_hunk_headers != 1 ||
        res.arena->hunk_old_start(0) != 4294967295U || res.arena->line_count() != 2) {
      std::cerr << "oversized hunk number accepted: old_start="
                << res.arena->hunk_old_start(0) << "\n";
      return 1;
    }
    const auto edge = run(head + "@@ -4294967295,1 +1 @@\n-a\n+b\n", pool);
    if (edge.stats.anomalies.malformed_hunk_headers != 0 ||
        edge.arena->hunk_old_start(0) != 4294967295U) {
      std::cerr << "largest 32-bit hunk number rejected\n";
      return 1;
    }
  }

  // Line numbers near the 32-bit limit stop there instead of wrapping
  {
    std::string text = head + "@@ -4294967289,10 +1,10 @@\n";
    for (int i = 0; i < 8; ++i) {
      text += " ctx\n";
    }
    const auto res = run(text, pool);
    const DiffArena &a = *res.arena;
    if (a.line_count() != 8 || a.line_old_number(0) != 4294967289U ||
        a.line_old_number(7) != 4294967295U || a.line_new_number(7) != 8) {
      std::cerr << "line numbers near the limit wrong\n";
      return 1;
    }
    for (std::uint32_t i = 1; i < a.line_count(); ++i) {
      if (a.line_old_number(i) < a.line_old_number(i - 1)) {
        std::cerr << "old line number decreased at " << i << "\n";
        return 1;
      }
    }
    if (res.stats.anomalies.truncated_hunks != 1 || res.stats.anomalies.malformed_hunk_headers != 0) {
      std::cerr << "near-limit hunk anomalies wrong\n";
      return 1;
    }
  }

  // Missing counts default to 1
  {
    const auto res = run(head + "@@ -7 +9 @@\n-a\n+b\n", pool);
    if (res.arena->hunk_old_lines(0) != 1 || res.arena->hunk_new_lines(0) != 1 ||
        res.stats.anomalies.total() != 0) {
      std::cerr << "single-count header wrong\n";
      return 1;
    }
  }

  // Trailing blank line and CRLF endings
  {
    const auto res = run(head + "@@ -1 +1 @@\r\n-a\r\n+b\r\n\n", pool);
    if (res.arena->line_count() != 2 || res.stats.anomalies.total() != 0 ||
        res.arena->decode_line_content(1) != "b\r") {
      std::cerr << "CRLF or trailing blank handling wrong\n";
      return 1;
    }
  }

  // Empty input
  {
    const auto res = run("", pool);
    if (res.arena->file_count() != 0 || res.stats.total_bytes != 0 ||
        res.stats.anomalies.total() != 0) {
      std::cerr << "empty input produced output\n";
      return 1;
    }
  }

  // Arbitrary bytes never throw
  {
    std::vector<std::uint8_t> junk;
    std::uint32_t seed = 12345;
    for (int i = 0; i < 64 * 1024; ++i) {
      seed = (seed * 1103515245U) + 12345U;
      const std::uint8_t pick = static_cast<std::uint8_t>(seed >> 16);
      // Bias towards diff punctuation so the state machine gets exercised
      static constexpr char kAlphabet[] = "@@ -+,\n 0123456789diff --git a/ b/\\";
      junk.push_back(pick % 3 == 0 ? pick
                                   : static_cast<std::uint8_t>(
                                         kAlphabet[pick % (sizeof(kAlphabet) - 1)]));
    }
    try {
      const auto res = parse_diff_buffer(junk, ParserOptions{.pool = &pool});
      if (res.stats.total_bytes != junk.size()) {
        std::cerr << "junk input size not recorded\n";
        return 1;
      }
      for (std::uint32_t i = 0; i < res.arena->line_count(); ++i) {
        (void)res.arena->decode_line_content(i);
      }
      for (std::uint32_t f = 0; f < res.arena->file_count(); ++f) {
        (void)res.arena->decode_file_path(f);
      }
    } catch (const std::exception &e) {
      std::cerr << "parser threw on junk input: " << e.what() << "\n";
      return 1;
    }
  }

  std::cout << "malformed input test OK\n";
  return 0;
}
