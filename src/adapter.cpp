#include "diffarena/adapter.hpp"

#include <string>
#include <utility>

namespace diffarena {

std::string_view to_string(FileStatus status) {
  switch (status) {
  case FileStatus::Added:
    return "added";
  case FileStatus::Deleted:
    return "deleted";
  case FileStatus::Renamed:
    return "renamed";
  case FileStatus::Modified:
    break;
  }
  return "modified";
}

std::string_view to_string(LineType type) {
  switch (type) {
  case LineType::Addition:
    return "add";
  case LineType::Deletion:
    return "del";
  case LineType::Context:
    break;
  }
  return "ctx";
}

} // namespace diffarena

namespace diffarena::adapter {

namespace {

[[noreturn]] void throw_stale(std::uint64_t view_gen, std::uint64_t arena_gen) {
  throw StaleViewError("adapter: view from arena generation " + std::to_string(view_gen) +
                       " used after reset (arena is at generation " +
                       std::to_string(arena_gen) + ")");
}

const std::string &intern_range(const DiffArena &arena, StringInternPool &pool, ByteRange range) {
  return pool.intern(arena.source().view(range));
}

const std::string &file_path(const DiffArena &arena, StringInternPool &pool, std::uint32_t file) {
  return intern_range(arena, pool, arena.file_new_path(file));
}

std::optional<std::string_view> rename_source(const DiffArena &arena, StringInternPool &pool,
                                              std::uint32_t file) {
  if (arena.file_status(file) != FileStatus::Renamed) {
    return std::nullopt;
  }
  return intern_range(arena, pool, arena.file_old_path(file));
}

Hunk materialize_hunk(const DiffArena &arena, std::uint32_t hunk) {
  Hunk out{.old_start = arena.hunk_old_start(hunk),
           .old_lines = arena.hunk_old_lines(hunk),
           .new_start = arena.hunk_new_start(hunk),
           .new_lines = arena.hunk_new_lines(hunk),
           .content = arena.decode_hunk_header(hunk),
           .additions = {},
           .deletions = {}};
  const std::uint32_t first = arena.hunk_first_line(hunk);
  const std::uint32_t last = first + arena.hunk_line_count(hunk);
  for (std::uint32_t i = first; i < last; ++i) {
    switch (arena.line_type(i)) {
    case LineType::Addition:
      out.additions.push_back(arena.decode_line_content(i));
      break;
    case LineType::Deletion:
      out.deletions.push_back(arena.decode_line_content(i));
      break;
    case LineType::Context:
      break;
    }
  }
  return out;
}

std::vector<Hunk> materialize_hunks(const DiffArena &arena, std::uint32_t file) {
  std::vector<Hunk> hunks;
  const std::uint32_t first = arena.file_first_hunk(file);
  const std::uint32_t count = arena.file_hunk_count(file);
  hunks.reserve(count);
  for (std::uint32_t h = first; h < first + count; ++h) {
    hunks.push_back(materialize_hunk(arena, h));
  }
  return hunks;
}

std::optional<std::string> to_owned(std::optional<std::string_view> sv) {
  if (!sv) {
    return std::nullopt;
  }
  return std::string(*sv);
}

} // namespace

// LazyFileDiff

LazyFileDiff::LazyFileDiff(std::shared_ptr<const DiffArena> arena, std::uint32_t file,
                           StringInternPool *pool)
    : arena_(std::move(arena)), file_(file), pool_(pool), generation_(arena_->generation()) {}

void LazyFileDiff::check_generation() const {
  if (is_stale()) {
    throw_stale(generation_, arena_->generation());
  }
}

const std::string &LazyFileDiff::path() const {
  check_generation();
  if (path_ == nullptr) {
    path_ = &file_path(*arena_, *pool_, file_);
  }
  return *path_;
}

FileStatus LazyFileDiff::status() const {
  check_generation();
  return arena_->file_status(file_);
}

std::optional<std::string_view> LazyFileDiff::old_path() const {
  check_generation();
  return rename_source(*arena_, *pool_, file_);
}

const std::vector<Hunk> &LazyFileDiff::hunks() const {
  check_generation();
  if (!hunks_) {
    hunks_ = materialize_hunks(*arena_, file_);
  }
  return *hunks_;
}

FileDiff LazyFileDiff::materialize() const {
  return FileDiff{.path = path(), .status = status(), .old_path = to_owned(old_path()),
                  .hunks = hunks()};
}

// ChangedLineRange

ChangedLineRange::ChangedLineRange(std::shared_ptr<const DiffArena> arena, StringInternPool *pool,
                                   LineType type)
    : arena_(std::move(arena)), pool_(pool), type_(type), generation_(arena_->generation()),
      end_(static_cast<std::uint32_t>(arena_->line_count())) {}

void ChangedLineRange::check_generation() const {
  if (arena_->generation() != generation_) {
    throw_stale(generation_, arena_->generation());
  }
}

ChangedLineRange::iterator ChangedLineRange::begin() const {
  check_generation();
  return iterator{this, 0};
}

ChangedLineRange::iterator ChangedLineRange::end() const { return iterator{this, end_}; }

ChangedLineRange::iterator::iterator(const ChangedLineRange *range, std::uint32_t index)
    : range_(range), index_(index) {
  settle();
}

ChangedLineRange::iterator &ChangedLineRange::iterator::operator++() {
  ++index_;
  settle();
  return *this;
}

// Move to the next line of the wanted type and decode it.
void ChangedLineRange::iterator::settle() {
  const ChangedLineRange &r = *range_;
  if (index_ >= r.end_) {
    index_ = r.end_;
    return;
  }
  r.check_generation();
  const DiffArena &arena = *r.arena_;
  while (index_ < r.end_ && arena.line_type(index_) != r.type_) {
    ++index_;
  }
  if (index_ == r.end_) {
    return;
  }
  current_.path = file_path(arena, *r.pool_, arena.line_file(index_));
  current_.content = arena.decode_line_content(index_);
  current_.line_number = r.type_ == LineType::Deletion ? arena.line_old_number(index_)
                                                       : arena.line_new_number(index_);
}

// Conversions

std::vector<FileDiff> to_file_diffs(const ParseResult &result) {
  const DiffArena &arena = *result.arena;
  std::vector<FileDiff> diffs;
  diffs.reserve(arena.file_count());
  for (std::uint32_t i = 0; i < arena.file_count(); ++i) {
    diffs.push_back(FileDiff{.path = file_path(arena, *result.pool, i),
                             .status = arena.file_status(i),
                             .old_path = to_owned(rename_source(arena, *result.pool, i)),
                             .hunks = materialize_hunks(arena, i)});
  }
  return diffs;
}

std::vector<LazyFileDiff> to_lazy_file_diffs(const ParseResult &result) {
  std::vector<LazyFileDiff> diffs;
  diffs.reserve(result.arena->file_count());
  for (std::uint32_t i = 0; i < result.arena->file_count(); ++i) {
    diffs.emplace_back(result.arena, i, result.pool);
  }
  return diffs;
}

std::vector<FileChange> to_file_changes(const ParseResult &result) {
  const DiffArena &arena = *result.arena;
  std::vector<FileChange> changes;
  changes.reserve(arena.file_count());
  for (std::uint32_t i = 0; i < arena.file_count(); ++i) {
    changes.push_back(FileChange{.path = file_path(arena, *result.pool, i),
                                 .status = arena.file_status(i),
                                 .old_path = to_owned(rename_source(arena, *result.pool, i))});
  }
  return changes;
}

std::vector<std::string> extract_file_paths(const ParseResult &result) {
  const DiffArena &arena = *result.arena;
  std::vector<std::string> paths;
  paths.reserve(arena.file_count());
  for (std::uint32_t i = 0; i < arena.file_count(); ++i) {
    paths.push_back(file_path(arena, *result.pool, i));
  }
  return paths;
}

bool has_file_where(const ParseResult &result,
                    const std::function<bool(std::string_view)> &predicate) {
  const DiffArena &arena = *result.arena;
  for (std::uint32_t i = 0; i < arena.file_count(); ++i) {
    if (predicate(file_path(arena, *result.pool, i))) {
      return true;
    }
  }
  return false;
}

bool has_file_matching(const ParseResult &result, const std::regex &pattern) {
  return has_file_where(result, [&pattern](std::string_view path) {
    return std::regex_search(path.begin(), path.end(), pattern);
  });
}

ChangedLineRange iterate_additions(const ParseResult &result) {
  return ChangedLineRange{result.arena, result.pool, LineType::Addition};
}

ChangedLineRange iterate_deletions(const ParseResult &result) {
  return ChangedLineRange{result.arena, result.pool, LineType::Deletion};
}

std::map<std::string, ChangeStats> get_change_stats(const ParseResult &result) {
  const DiffArena &arena = *result.arena;
  std::map<std::string, ChangeStats> stats;
  for (std::uint32_t f = 0; f < arena.file_count(); ++f) {
    ChangeStats &entry = stats[file_path(arena, *result.pool, f)];
    const std::uint32_t first_hunk = arena.file_first_hunk(f);
    const std::uint32_t last_hunk = first_hunk + arena.file_hunk_count(f);
    for (std::uint32_t h = first_hunk; h < last_hunk; ++h) {
      const std::uint32_t first = arena.hunk_first_line(h);
      const std::uint32_t last = first + arena.hunk_line_count(h);
      for (std::uint32_t i = first; i < last; ++i) {
        const LineType type = arena.line_type(i);
        if (type == LineType::Addition) {
          ++entry.additions;
        } else if (type == LineType::Deletion) {
          ++entry.deletions;
        }
      }
    }
  }
  return stats;
}

} // namespace diffarena::adapter
