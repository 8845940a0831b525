#include "diffarena/parser.hpp"

#include "diffarena/consts.hpp"
#include "diffarena/scanner.hpp"

#include <chrono>
#include <iostream>
#include <limits>
#include <utility>

namespace diffarena {

namespace {

enum class State : std::uint8_t {
  Idle,                  // no file yet
  AwaitingStatusOrPaths, // after "diff --git", reading extended header lines
  AwaitingHunk,          // after ---/+++, before the first "@@"
  InHunk,
};

constexpr std::uint32_t kUnbounded = std::numeric_limits<std::uint32_t>::max();

ByteRange after_prefix(ByteRange line, std::string_view prefix) {
  return {.offset = line.offset + static_cast<std::uint32_t>(prefix.size()),
          .length = line.length - static_cast<std::uint32_t>(prefix.size())};
}

// One parse call: cursor state plus the arena being filled.
class ParseSession {
public:
  ParseSession(DiffArena &arena, DiffScanner &scanner, ParseAnomalies &anomalies, bool verbose)
      : arena_(arena), scanner_(scanner), anomalies_(anomalies), verbose_(verbose) {}

  void run() {
    while (auto tok = scanner_.scan_line()) {
      switch (tok->kind) {
      case TokenKind::DiffHeader:
        on_diff_header(*tok);
        break;
      case TokenKind::OldFilePath:
        on_old_path(*tok);
        break;
      case TokenKind::NewFilePath:
        on_new_path(*tok);
        break;
      case TokenKind::HunkHeader:
        on_hunk_header(*tok);
        break;
      case TokenKind::Addition:
        on_content(LineType::Addition, tok->content, tok->line);
        break;
      case TokenKind::Deletion:
        on_content(LineType::Deletion, tok->content, tok->line);
        break;
      case TokenKind::Context:
        on_content(LineType::Context, tok->content, tok->line);
        break;
      case TokenKind::Metadata:
        on_metadata(*tok);
        break;
      }
    }
    close_hunk();
  }

private:
  // ——— File headers ———

  void on_diff_header(const Token &tok) {
    close_hunk();
    ByteRange old_path{};
    ByteRange new_path{};
    if (const auto paths = scanner_.extract_diff_path(tok.content)) {
      old_path = paths->old_path;
      new_path = paths->new_path;
    } else {
      // Unsplittable header: keep its text so the file is never nameless.
      // ---/+++ or rename lines that follow still replace it.
      ByteRange raw = tok.content;
      if (scanner_.starts_with(raw, consts::kGitPrefix)) {
        raw = after_prefix(raw, consts::kGitPrefix);
      }
      old_path = raw;
      new_path = raw;
      log("diff header without a/ b/ paths", tok.line);
    }
    open_file(FileStatus::Modified, old_path, new_path);
    state_ = State::AwaitingStatusOrPaths;
  }

  // True while the current file has no hunks: extended header lines and
  // ---/+++ still refine it.
  [[nodiscard]] bool in_file_header() const {
    return (state_ == State::AwaitingStatusOrPaths || state_ == State::AwaitingHunk) &&
           arena_.file_hunk_count(file_) == 0;
  }

  void on_metadata(const Token &tok) {
    if (state_ == State::InHunk) {
      if (tok.line.length > 0 && scanner_.view(tok.line).front() == consts::kBackslash) {
        return; // "\ No newline at end of file"
      }
      if (exhausted()) {
        return; // trailer after a complete hunk
      }
      ++anomalies_.unrecognized_lines;
      log("unrecognized line prefix inside hunk", tok.line);
      append(LineType::Context, tok.line);
      return;
    }
    if (!in_file_header()) {
      return;
    }

    const ByteRange line = tok.line;
    if (scanner_.starts_with(line, consts::kNewFileMode)) {
      arena_.set_file_status(file_, FileStatus::Added);
    } else if (scanner_.starts_with(line, consts::kDeletedFileMode)) {
      arena_.set_file_status(file_, FileStatus::Deleted);
    } else if (scanner_.starts_with(line, consts::kRenameFrom)) {
      arena_.set_file_status(file_, FileStatus::Renamed);
      arena_.set_file_old_path(file_, after_prefix(line, consts::kRenameFrom));
    } else if (scanner_.starts_with(line, consts::kRenameTo)) {
      arena_.set_file_status(file_, FileStatus::Renamed);
      arena_.set_file_new_path(file_, after_prefix(line, consts::kRenameTo));
    } else if (scanner_.starts_with(line, consts::kCopyFrom)) {
      arena_.set_file_status(file_, FileStatus::Added);
      arena_.set_file_old_path(file_, after_prefix(line, consts::kCopyFrom));
    } else if (scanner_.starts_with(line, consts::kCopyTo)) {
      arena_.set_file_status(file_, FileStatus::Added);
      arena_.set_file_new_path(file_, after_prefix(line, consts::kCopyTo));
    } else if (scanner_.starts_with(line, consts::kSimilarityIndex)) {
      if (arena_.file_status(file_) == FileStatus::Modified) {
        arena_.set_file_status(file_, FileStatus::Renamed);
      }
    }
  }

  void on_old_path(const Token &tok) {
    // "--- x" inside a hunk that still owes old lines is the deletion of "-- x".
    if (state_ == State::InHunk && remaining_old_ > 0) {
      on_content(LineType::Deletion, after_prefix(tok.line, "-"), tok.line);
      return;
    }
    close_hunk();

    const auto path = scanner_.extract_file_path(tok.content);
    if (!has_file_ || !in_file_header()) {
      // Plain "diff -u" output: the --- line opens the file.
      const bool null_old = path && scanner_.is_dev_null(*path);
      const ByteRange p = (path && !null_old) ? *path : ByteRange{};
      open_file(null_old ? FileStatus::Added : FileStatus::Modified, p, p);
    } else if (path) {
      if (scanner_.is_dev_null(*path)) {
        arena_.set_file_status(file_, FileStatus::Added);
      } else {
        arena_.set_file_old_path(file_, *path);
      }
    }
    state_ = State::AwaitingHunk;
  }

  void on_new_path(const Token &tok) {
    if (state_ == State::InHunk && remaining_new_ > 0) {
      on_content(LineType::Addition, after_prefix(tok.line, "+"), tok.line);
      return;
    }
    close_hunk();

    const auto path = scanner_.extract_file_path(tok.content);
    const bool null_new = path && scanner_.is_dev_null(*path);
    if (!has_file_ || !in_file_header()) {
      const ByteRange p = (path && !null_new) ? *path : ByteRange{};
      open_file(null_new ? FileStatus::Deleted : FileStatus::Modified, p, p);
    } else if (null_new) {
      // Deleted file keeps its real path as the new path.
      arena_.set_file_status(file_, FileStatus::Deleted);
      if (arena_.file_new_path(file_).empty()) {
        arena_.set_file_new_path(file_, arena_.file_old_path(file_));
      }
    } else if (path) {
      arena_.set_file_new_path(file_, *path);
      const ByteRange old_path = arena_.file_old_path(file_);
      if (old_path.empty()) {
        arena_.set_file_old_path(file_, *path);
      } else if (arena_.file_status(file_) == FileStatus::Modified &&
                 !scanner_.is_dev_null(old_path) &&
                 scanner_.view(old_path) != scanner_.view(*path)) {
        // "--- a/x" / "+++ b/y" without rename lines is still a rename.
        arena_.set_file_status(file_, FileStatus::Renamed);
      }
    }
    state_ = State::AwaitingHunk;
  }

  void open_file(FileStatus status, ByteRange old_path, ByteRange new_path) {
    file_ = arena_.add_file(status, old_path, new_path);
    has_file_ = true;
  }

  // ——— Hunks ———

  void on_hunk_header(const Token &tok) {
    if (!has_file_) {
      ++anomalies_.stray_lines;
      log("hunk header before any file header", tok.line);
      return;
    }
    close_hunk();

    const HunkRange &r = tok.hunk;
    if (r.well_formed) {
      remaining_old_ = r.old_lines;
      remaining_new_ = r.new_lines;
    } else {
      ++anomalies_.malformed_hunk_headers;
      log("malformed hunk header", tok.line);
      remaining_old_ = kUnbounded;
      remaining_new_ = kUnbounded;
    }
    hunk_ = arena_.add_hunk(file_, r.old_start, r.old_lines, r.new_start, r.new_lines, tok.line);
    running_old_ = r.old_start;
    running_new_ = r.new_start;
    state_ = State::InHunk;
  }

  [[nodiscard]] bool exhausted() const { return remaining_old_ == 0 && remaining_new_ == 0; }

  void close_hunk() {
    if (state_ != State::InHunk) {
      return;
    }
    if (remaining_old_ != kUnbounded && !exhausted()) {
      ++anomalies_.truncated_hunks;
      if (verbose_) {
        std::cerr << "parser: hunk " << hunk_ << " ended with " << remaining_old_ << " old / "
                  << remaining_new_ << " new lines missing\n";
      }
    }
    remaining_old_ = 0;
    remaining_new_ = 0;
    state_ = State::AwaitingHunk;
  }

  // ——— Lines ———

  void on_content(LineType type, ByteRange content, ByteRange line) {
    if (state_ != State::InHunk) {
      if (line.length > 0) {
        ++anomalies_.stray_lines;
        log("content line outside a hunk", line);
      }
      return;
    }
    if (exhausted()) {
      // Past the header's counts: a blank separator, or trailing text such as
      // the "-- " signature of git format-patch. Not part of the hunk.
      if (line.length > 0) {
        ++anomalies_.excess_lines;
        log("line past the hunk's counts", line);
      }
      return;
    }
    append(type, content);
  }

  void append(LineType type, ByteRange content) {
    switch (type) {
    case LineType::Addition:
      arena_.add_line(type, hunk_, content, 0, running_new_);
      advance(running_new_);
      consume(remaining_new_);
      break;
    case LineType::Deletion:
      arena_.add_line(type, hunk_, content, running_old_, 0);
      advance(running_old_);
      consume(remaining_old_);
      break;
    case LineType::Context:
      arena_.add_line(type, hunk_, content, running_old_, running_new_);
      advance(running_old_);
      advance(running_new_);
      consume(remaining_old_);
      consume(remaining_new_);
      break;
    }
  }

  // Line numbers stop at the 32-bit maximum rather than wrap to 0.
  static void advance(std::uint32_t &line_no) {
    if (line_no != std::numeric_limits<std::uint32_t>::max()) {
      ++line_no;
    }
  }

  static void consume(std::uint32_t &remaining) {
    if (remaining != kUnbounded && remaining > 0) {
      --remaining;
    }
  }

  void log(const char *what, ByteRange line) const {
    if (verbose_) {
      std::cerr << "parser: " << what << " at byte " << line.offset << ": "
                << scanner_.view(line) << "\n";
    }
  }

  DiffArena &arena_;
  DiffScanner &scanner_;
  ParseAnomalies &anomalies_;
  bool verbose_;

  State state_ = State::Idle;
  bool has_file_ = false;
  std::uint32_t file_ = 0;
  std::uint32_t hunk_ = 0;
  std::uint32_t running_old_ = 0;
  std::uint32_t running_new_ = 0;
  std::uint32_t remaining_old_ = 0;
  std::uint32_t remaining_new_ = 0;
};

} // namespace

StreamingDiffParser::StreamingDiffParser(ParserOptions options) : options_(std::move(options)) {}

ParseResult StreamingDiffParser::parse(SourceBuffer source) {
  const auto started = std::chrono::steady_clock::now();

  std::shared_ptr<DiffArena> arena = options_.arena;
  if (arena) {
    arena->reset();
  } else if (options_.capacity_hints) {
    arena = std::make_shared<DiffArena>(*options_.capacity_hints);
  } else {
    arena = std::make_shared<DiffArena>(make_arena_for_size(source.size()));
  }
  arena->set_source(source);

  ParseResult result{.arena = arena,
                     .pool = options_.pool != nullptr ? options_.pool : &global_intern_pool(),
                     .stats = ParseStats{}};
  result.stats.total_bytes = source.size();

  DiffScanner scanner{std::move(source)};
  ParseSession session{*arena, scanner, result.stats.anomalies, options_.verbose};
  session.run();

  result.stats.files_found = arena->file_count();
  result.stats.hunks_found = arena->hunk_count();
  result.stats.lines_found = arena->line_count();
  result.stats.parse_time_ms =
      std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started)
          .count();

  if (options_.verbose) {
    std::cerr << "parser: " << result.stats.files_found << " files, "
              << result.stats.hunks_found << " hunks, " << result.stats.lines_found
              << " lines in " << result.stats.total_bytes << " bytes ("
              << result.stats.anomalies.total() << " anomalies, " << result.stats.parse_time_ms
              << " ms)\n";
  }
  return result;
}

ParseResult StreamingDiffParser::parse(std::string_view text) {
  return parse(SourceBuffer::from_string(text));
}

ParseResult StreamingDiffParser::parse(std::vector<std::uint8_t> bytes) {
  return parse(SourceBuffer::from_bytes(std::move(bytes)));
}

ParseResult parse_diff_string(std::string_view text, ParserOptions options) {
  StreamingDiffParser parser{std::move(options)};
  return parser.parse(text);
}

ParseResult parse_diff_buffer(std::vector<std::uint8_t> bytes, ParserOptions options) {
  StreamingDiffParser parser{std::move(options)};
  return parser.parse(std::move(bytes));
}

} // namespace diffarena
