#pragma once
#include "diffarena/arena.hpp"
#include "diffarena/intern.hpp"
#include "diffarena/parser.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <regex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace diffarena {

// "added" | "modified" | "deleted" | "renamed"
std::string_view to_string(FileStatus status);
// "add" | "del" | "ctx"
std::string_view to_string(LineType type);

// A lazy view was used after its arena was reset or reused for another parse.
class StaleViewError : public std::logic_error {
public:
  using std::logic_error::logic_error;
};

} // namespace diffarena

namespace diffarena::adapter {

struct Hunk {
  std::uint32_t old_start = 0;
  std::uint32_t old_lines = 0;
  std::uint32_t new_start = 0;
  std::uint32_t new_lines = 0;
  std::string content; // the "@@ ... @@" header line
  std::vector<std::string> additions;
  std::vector<std::string> deletions;
  bool operator==(const Hunk &) const = default;
};

struct FileDiff {
  std::string path;
  FileStatus status = FileStatus::Modified;
  std::optional<std::string> old_path; // renames only
  std::vector<Hunk> hunks;
  bool operator==(const FileDiff &) const = default;
};

struct FileChange {
  std::string path;
  FileStatus status = FileStatus::Modified;
  std::optional<std::string> old_path; // renames only
  bool operator==(const FileChange &) const = default;
};

struct ChangeStats {
  std::size_t additions = 0;
  std::size_t deletions = 0;
  bool operator==(const ChangeStats &) const = default;
};

// FileDiff that decodes on first access. Bound to the arena generation it
// was created from: every accessor throws StaleViewError once that arena has
// been reset.
class LazyFileDiff {
public:
  LazyFileDiff(std::shared_ptr<const DiffArena> arena, std::uint32_t file,
               StringInternPool *pool);

  [[nodiscard]] const std::string &path() const;
  [[nodiscard]] FileStatus status() const;
  [[nodiscard]] std::optional<std::string_view> old_path() const;
  [[nodiscard]] const std::vector<Hunk> &hunks() const;

  [[nodiscard]] FileDiff materialize() const;

  [[nodiscard]] std::uint32_t index() const { return file_; }
  [[nodiscard]] bool is_stale() const { return arena_->generation() != generation_; }
  [[nodiscard]] bool hunks_decoded() const { return hunks_.has_value(); }

private:
  void check_generation() const;

  std::shared_ptr<const DiffArena> arena_;
  std::uint32_t file_;
  StringInternPool *pool_;
  std::uint64_t generation_;

  mutable const std::string *path_ = nullptr;
  mutable std::optional<std::vector<Hunk>> hunks_;
};

struct ChangedLine {
  std::string_view path; // interned; valid until the pool is cleared
  std::string content;
  std::uint32_t line_number = 0; // new side for additions, old side for deletions
};

// Single-pass sequence over the additions (or deletions) of a parse, in file
// order then line order. Each call to iterate_* builds a fresh range.
class ChangedLineRange {
public:
  class iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = ChangedLine;
    using difference_type = std::ptrdiff_t;
    using pointer = const ChangedLine *;
    using reference = const ChangedLine &;

    iterator() = default;

    reference operator*() const { return current_; }
    pointer operator->() const { return &current_; }
    iterator &operator++();
    iterator operator++(int) {
      iterator prev = *this;
      ++*this;
      return prev;
    }
    bool operator==(const iterator &other) const { return index_ == other.index_; }

  private:
    friend class ChangedLineRange;
    iterator(const ChangedLineRange *range, std::uint32_t index);
    void settle();

    const ChangedLineRange *range_ = nullptr;
    std::uint32_t index_ = 0;
    ChangedLine current_;
  };

  ChangedLineRange(std::shared_ptr<const DiffArena> arena, StringInternPool *pool, LineType type);

  [[nodiscard]] iterator begin() const;
  [[nodiscard]] iterator end() const;

private:
  void check_generation() const;

  std::shared_ptr<const DiffArena> arena_;
  StringInternPool *pool_;
  LineType type_;
  std::uint64_t generation_;
  std::uint32_t end_;
};

// Fully decoded records.
std::vector<FileDiff> to_file_diffs(const ParseResult &result);
// Decode-on-access records; see LazyFileDiff.
std::vector<LazyFileDiff> to_lazy_file_diffs(const ParseResult &result);

std::vector<FileChange> to_file_changes(const ParseResult &result);
std::vector<std::string> extract_file_paths(const ParseResult &result);

// Stop at the first path that matches.
bool has_file_matching(const ParseResult &result, const std::regex &pattern);
bool has_file_where(const ParseResult &result,
                    const std::function<bool(std::string_view)> &predicate);

ChangedLineRange iterate_additions(const ParseResult &result);
ChangedLineRange iterate_deletions(const ParseResult &result);

// path -> counts; a path listed twice accumulates.
std::map<std::string, ChangeStats> get_change_stats(const ParseResult &result);

} // namespace diffarena::adapter
