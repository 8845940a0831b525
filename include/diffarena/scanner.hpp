#pragma once
#include "diffarena/source.hpp"

#include <cstdint>
#include <optional>
#include <string_view>

namespace diffarena {

enum class TokenKind : std::uint8_t {
  DiffHeader,  // diff --git a/... b/...
  OldFilePath, // --- a/path | --- /dev/null
  NewFilePath, // +++ b/path | +++ /dev/null
  HunkHeader,  // @@ -a,b +c,d @@
  Addition,
  Deletion,
  Context,
  Metadata,    // index, mode, rename, "\ No newline at end of file", ...
};

struct HunkRange {
  std::uint32_t old_start = 0;
  std::uint32_t old_lines = 1;
  std::uint32_t new_start = 0;
  std::uint32_t new_lines = 1;
  bool well_formed = true; // false if a number was missing, non-numeric or past 32 bits
};

struct Token {
  TokenKind kind;
  ByteRange line;    // whole line, newline excluded
  ByteRange content; // line minus the kind's marker
  HunkRange hunk;    // HunkHeader only
};

struct DiffPaths {
  ByteRange old_path;
  ByteRange new_path;
};

// Line-oriented tokenizer over a SourceBuffer. Never copies or allocates
// strings: every token is a pair of byte ranges into the buffer.
class DiffScanner {
public:
  explicit DiffScanner(SourceBuffer source);

  // Next line, or nullopt at end of input. A final line without a trailing
  // newline is still returned.
  std::optional<Token> scan_line();

  // Advance past the current line without classifying it.
  void skip_line();

  // Offset of the next occurrence of `pattern` at or after the cursor.
  [[nodiscard]] auto scan_until(std::string_view pattern) const -> std::optional<std::size_t>;

  // Split the content of a DiffHeader token ("git a/x b/y") into path ranges.
  [[nodiscard]] auto extract_diff_path(ByteRange content) const -> std::optional<DiffPaths>;

  // Path from the content of an Old/NewFilePath token: strips "a/" or "b/",
  // keeps "/dev/null" as is, drops a trailing tab-separated timestamp.
  [[nodiscard]] auto extract_file_path(ByteRange content) const -> std::optional<ByteRange>;

  [[nodiscard]] auto is_dev_null(ByteRange range) const -> bool;
  [[nodiscard]] auto starts_with(ByteRange range, std::string_view prefix) const -> bool;

  [[nodiscard]] auto view(ByteRange range) const -> std::string_view { return source_.view(range); }
  [[nodiscard]] auto source() const -> const SourceBuffer & { return source_; }

  [[nodiscard]] auto get_position() const -> std::size_t { return cursor_; }
  [[nodiscard]] auto has_more() const -> bool { return cursor_ < length_; }
  void reset() { cursor_ = 0; }

private:
  [[nodiscard]] auto find_line_end() const -> std::size_t;
  [[nodiscard]] auto matches(std::size_t offset, std::string_view pattern) const -> bool;
  [[nodiscard]] auto parse_hunk_header(std::size_t start, std::size_t length) const -> HunkRange;

  SourceBuffer source_;
  const std::uint8_t *bytes_;
  std::size_t length_;
  std::size_t cursor_ = 0;
};

} // namespace diffarena
