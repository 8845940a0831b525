#pragma once
#include "diffarena/arena.hpp"
#include "diffarena/intern.hpp"
#include "diffarena/source.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace diffarena {

// Input problems the parser tolerated. Informational only.
struct ParseAnomalies {
  std::size_t malformed_hunk_headers = 0; // "@@" line without usable numbers
  std::size_t truncated_hunks = 0;        // hunk closed with lines still owed
  std::size_t unrecognized_lines = 0;     // unknown prefix inside a hunk, kept as context
  std::size_t stray_lines = 0;            // content line outside any hunk, dropped
  std::size_t excess_lines = 0;           // content line past the header's counts, dropped

  [[nodiscard]] auto total() const -> std::size_t {
    return malformed_hunk_headers + truncated_hunks + unrecognized_lines + stray_lines +
           excess_lines;
  }
  bool operator==(const ParseAnomalies &) const = default;
};

struct ParseStats {
  std::size_t total_bytes = 0;
  double parse_time_ms = 0.0;
  std::size_t files_found = 0;
  std::size_t hunks_found = 0;
  std::size_t lines_found = 0;
  ParseAnomalies anomalies;
};

struct ParserOptions {
  // Reused (after reset()) when set; otherwise sized from the input.
  std::shared_ptr<DiffArena> arena;
  // Non-owning; defaults to global_intern_pool().
  StringInternPool *pool = nullptr;
  // Capacity for a fresh arena; ignored when `arena` is set.
  std::optional<ArenaOptions> capacity_hints;
  // Log anomalies and a summary line to std::cerr.
  bool verbose = false;
};

struct ParseResult {
  std::shared_ptr<DiffArena> arena;
  StringInternPool *pool = nullptr;
  ParseStats stats;
};

// Single-pass state machine over DiffScanner tokens that fills a DiffArena.
// Never throws on malformed input; see ParseAnomalies.
class StreamingDiffParser {
public:
  explicit StreamingDiffParser(ParserOptions options = {});

  ParseResult parse(SourceBuffer source);
  ParseResult parse(std::string_view text);
  ParseResult parse(std::vector<std::uint8_t> bytes);

private:
  ParserOptions options_;
};

ParseResult parse_diff_string(std::string_view text, ParserOptions options = {});
ParseResult parse_diff_buffer(std::vector<std::uint8_t> bytes, ParserOptions options = {});

} // namespace diffarena
