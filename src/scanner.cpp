#include "diffarena/scanner.hpp"

#include "diffarena/consts.hpp"

#include <cstring>
#include <limits>
#include <utility>

namespace diffarena {

namespace {

constexpr std::uint32_t kNumberMax = std::numeric_limits<std::uint32_t>::max();

struct Number {
  std::uint32_t value = 0;
  std::size_t end = 0;
  bool found = false;
  bool overflow = false; // value clamped to kNumberMax
};

// Parse decimal digits at [pos, end); a value past 32 bits is clamped and
// flagged.
Number parse_number(const std::uint8_t *bytes, std::size_t pos, std::size_t end) {
  Number n{.value = 0, .end = pos, .found = false, .overflow = false};
  while (n.end < end && bytes[n.end] >= '0' && bytes[n.end] <= '9') {
    const auto digit = static_cast<std::uint32_t>(bytes[n.end] - '0');
    if (!n.overflow && n.value > (kNumberMax - digit) / 10) {
      n.overflow = true;
      n.value = kNumberMax;
    } else if (!n.overflow) {
      n.value = (n.value * 10) + digit;
    }
    n.found = true;
    ++n.end;
  }
  return n;
}

// A header number is usable if digits were present and fit in 32 bits.
bool usable(const Number &n) { return n.found && !n.overflow; }

ByteRange make_range(std::size_t offset, std::size_t length) {
  return ByteRange{.offset = static_cast<std::uint32_t>(offset),
                   .length = static_cast<std::uint32_t>(length)};
}

Token make_token(TokenKind kind, std::size_t line_start, std::size_t line_len,
                 std::size_t marker_len) {
  return Token{.kind = kind,
               .line = make_range(line_start, line_len),
               .content = make_range(line_start + marker_len, line_len - marker_len),
               .hunk = HunkRange{}};
}

} // namespace

DiffScanner::DiffScanner(SourceBuffer source)
    : source_(std::move(source)), bytes_(source_.data()), length_(source_.size()) {}

std::size_t DiffScanner::find_line_end() const {
  const void *nl = std::memchr(bytes_ + cursor_, consts::kLF, length_ - cursor_);
  if (nl == nullptr) {
    return length_;
  }
  return static_cast<std::size_t>(static_cast<const std::uint8_t *>(nl) - bytes_);
}

bool DiffScanner::matches(std::size_t offset, std::string_view pattern) const {
  if (offset > length_ || pattern.size() > length_ - offset) {
    return false;
  }
  return std::memcmp(bytes_ + offset, pattern.data(), pattern.size()) == 0;
}

bool DiffScanner::starts_with(ByteRange range, std::string_view prefix) const {
  return range.length >= prefix.size() && matches(range.offset, prefix);
}

bool DiffScanner::is_dev_null(ByteRange range) const {
  return range.length == consts::kDevNull.size() && matches(range.offset, consts::kDevNull);
}

std::optional<Token> DiffScanner::scan_line() {
  if (cursor_ >= length_) {
    return std::nullopt;
  }

  const std::size_t start = cursor_;
  const std::size_t end = find_line_end();
  const std::size_t len = end - start;
  cursor_ = end + 1;

  // Empty line: context with the leading space stripped by an editor or mailer.
  if (len == 0) {
    return make_token(TokenKind::Context, start, 0, 0);
  }

  switch (bytes_[start]) {
  case 'd':
    if (matches(start, consts::kDiffMarker)) {
      return make_token(TokenKind::DiffHeader, start, len, consts::kDiffMarker.size());
    }
    break;

  case consts::kMinus:
    if (matches(start, consts::kOldFileMarker)) {
      return make_token(TokenKind::OldFilePath, start, len, consts::kOldFileMarker.size());
    }
    if (len == consts::kOldFileBare.size() && matches(start, consts::kOldFileBare)) {
      return make_token(TokenKind::OldFilePath, start, len, len);
    }
    return make_token(TokenKind::Deletion, start, len, 1);

  case consts::kPlus:
    if (matches(start, consts::kNewFileMarker)) {
      return make_token(TokenKind::NewFilePath, start, len, consts::kNewFileMarker.size());
    }
    if (len == consts::kNewFileBare.size() && matches(start, consts::kNewFileBare)) {
      return make_token(TokenKind::NewFilePath, start, len, len);
    }
    return make_token(TokenKind::Addition, start, len, 1);

  case consts::kAt:
    if (matches(start, consts::kHunkMarker)) {
      Token tok = make_token(TokenKind::HunkHeader, start, len, 0);
      tok.hunk = parse_hunk_header(start, len);
      return tok;
    }
    break;

  case consts::kSpace:
    return make_token(TokenKind::Context, start, len, 1);

  default:
    break;
  }
  return make_token(TokenKind::Metadata, start, len, 0);
}

void DiffScanner::skip_line() {
  if (cursor_ < length_) {
    cursor_ = find_line_end() + 1;
  }
}

std::optional<std::size_t> DiffScanner::scan_until(std::string_view pattern) const {
  if (pattern.empty() || pattern.size() > length_) {
    return std::nullopt;
  }
  for (std::size_t i = cursor_; i + pattern.size() <= length_; ++i) {
    if (bytes_[i] == static_cast<std::uint8_t>(pattern.front()) && matches(i, pattern)) {
      return i;
    }
  }
  return std::nullopt;
}

// @@ -old[,count] +new[,count] @@ [section heading]
HunkRange DiffScanner::parse_hunk_header(std::size_t start, std::size_t length) const {
  HunkRange r{};
  const std::size_t end = start + length;
  std::size_t pos = start + consts::kHunkMarker.size();

  const Number old_start = parse_number(bytes_, pos, end);
  r.old_start = old_start.value;
  r.well_formed = usable(old_start);
  pos = old_start.end;

  if (pos < end && bytes_[pos] == consts::kComma) {
    const Number old_lines = parse_number(bytes_, pos + 1, end);
    r.old_lines = old_lines.value;
    r.well_formed = r.well_formed && usable(old_lines);
    pos = old_lines.end;
  }

  while (pos < end && bytes_[pos] != consts::kPlus) {
    ++pos;
  }
  if (pos >= end) {
    r.well_formed = false;
    return r;
  }
  ++pos;

  const Number new_start = parse_number(bytes_, pos, end);
  r.new_start = new_start.value;
  r.well_formed = r.well_formed && usable(new_start);
  pos = new_start.end;

  if (pos < end && bytes_[pos] == consts::kComma) {
    const Number new_lines = parse_number(bytes_, pos + 1, end);
    r.new_lines = new_lines.value;
    r.well_formed = r.well_formed && usable(new_lines);
  }
  return r;
}

std::optional<DiffPaths> DiffScanner::extract_diff_path(ByteRange content) const {
  std::size_t pos = content.offset;
  const std::size_t end = content.end();
  if (matches(pos, consts::kGitPrefix)) {
    pos += consts::kGitPrefix.size();
  }
  if (pos >= end) {
    return std::nullopt;
  }
  const std::size_t n = end - pos;
  const std::uint8_t *p = bytes_ + pos;

  // Unrenamed file: "a/<path> b/<path>" splits exactly in the middle, which
  // also copes with paths that contain " b/".
  if (n >= 5 && n % 2 == 1) {
    const std::size_t half = (n - 1) / 2;
    if (p[half] == consts::kSpace) {
      const bool prefixed = p[0] == 'a' && p[1] == '/' && p[half + 1] == 'b' && p[half + 2] == '/';
      const std::size_t skip = prefixed ? 2 : 0;
      if (std::memcmp(p + skip, p + half + 1 + skip, half - skip) == 0) {
        return DiffPaths{.old_path = make_range(pos + skip, half - skip),
                         .new_path = make_range(pos + half + 1 + skip, half - skip)};
      }
    }
  }

  // Renamed file: first "a/", then the first " b/" after it.
  std::size_t a = pos;
  while (a + 1 < end && !(bytes_[a] == 'a' && bytes_[a + 1] == '/')) {
    ++a;
  }
  if (a + 1 >= end) {
    return std::nullopt;
  }
  const std::size_t old_start = a + 2;
  std::size_t sep = old_start;
  while (sep + 3 <= end && !matches(sep, " b/")) {
    ++sep;
  }
  if (sep + 3 > end) {
    return std::nullopt;
  }
  return DiffPaths{.old_path = make_range(old_start, sep - old_start),
                   .new_path = make_range(sep + 3, end - (sep + 3))};
}

std::optional<ByteRange> DiffScanner::extract_file_path(ByteRange content) const {
  std::size_t start = content.offset;
  std::size_t end = content.end();

  // "--- file<TAB>timestamp" from diff -u; git also pads names with spaces.
  for (std::size_t i = start; i < end; ++i) {
    if (bytes_[i] == consts::kTab) {
      end = i;
      break;
    }
  }
  if (end <= start) {
    return std::nullopt;
  }

  const ByteRange raw = make_range(start, end - start);
  if (is_dev_null(raw)) {
    return raw;
  }
  if (end - start >= 2 && (bytes_[start] == 'a' || bytes_[start] == 'b') &&
      bytes_[start + 1] == '/') {
    start += 2;
  }
  return make_range(start, end - start);
}

} // namespace diffarena
