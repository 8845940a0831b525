#pragma once
#include "diffarena/consts.hpp"
#include "diffarena/source.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace diffarena {

enum class LineType : std::uint8_t { Addition = 0, Deletion = 1, Context = 2 };

enum class FileStatus : std::uint8_t { Added = 0, Modified = 1, Deleted = 2, Renamed = 3 };

struct ArenaOptions {
  std::size_t line_capacity = consts::kDefaultLineCapacity;
  std::size_t hunk_capacity = consts::kDefaultHunkCapacity;
  std::size_t file_capacity = consts::kDefaultFileCapacity;
};

struct ArenaMemoryStats {
  std::size_t file_count = 0;
  std::size_t hunk_count = 0;
  std::size_t line_count = 0;
  std::size_t file_capacity = 0;
  std::size_t hunk_capacity = 0;
  std::size_t line_capacity = 0;
  std::size_t total_bytes = 0; // backing storage of every column
  std::size_t used_bytes = 0;  // bytes holding live entries
  double utilization = 0.0;    // used_bytes / total_bytes
};

// Columnar store for one parsed diff. Files, hunks and lines each live in a
// set of parallel arrays addressed by dense indices; text is never copied in,
// only (offset, length) ranges into the session's SourceBuffer.
//
// Hunks of a file and lines of a hunk are contiguous, because the parser
// appends them in input order.
class DiffArena {
public:
  // Throws std::invalid_argument if any capacity is zero.
  explicit DiffArena(const ArenaOptions &options = ArenaOptions{});

  void set_source(SourceBuffer source);
  [[nodiscard]] auto source() const -> const SourceBuffer & { return source_; }
  [[nodiscard]] auto has_source() const -> bool { return source_set_; }

  // ——— Append ———
  std::uint32_t add_file(FileStatus status, ByteRange old_path, ByteRange new_path);
  std::uint32_t add_hunk(std::uint32_t file, std::uint32_t old_start, std::uint32_t old_lines,
                         std::uint32_t new_start, std::uint32_t new_lines, ByteRange header);
  std::uint32_t add_line(LineType type, std::uint32_t hunk, ByteRange content,
                         std::uint32_t old_number, std::uint32_t new_number);

  // ——— Refinement while a file header is still being read ———
  void set_file_status(std::uint32_t file, FileStatus status);
  void set_file_old_path(std::uint32_t file, ByteRange path);
  void set_file_new_path(std::uint32_t file, ByteRange path);

  // ——— Counts ———
  [[nodiscard]] auto file_count() const -> std::size_t { return file_count_; }
  [[nodiscard]] auto hunk_count() const -> std::size_t { return hunk_count_; }
  [[nodiscard]] auto line_count() const -> std::size_t { return line_count_; }
  [[nodiscard]] auto generation() const -> std::uint64_t { return generation_; }

  // ——— Columns (bounds-checked, std::out_of_range) ———
  [[nodiscard]] FileStatus file_status(std::uint32_t file) const;
  [[nodiscard]] ByteRange file_old_path(std::uint32_t file) const;
  [[nodiscard]] ByteRange file_new_path(std::uint32_t file) const;
  [[nodiscard]] std::uint32_t file_first_hunk(std::uint32_t file) const;
  [[nodiscard]] std::uint32_t file_hunk_count(std::uint32_t file) const;

  [[nodiscard]] std::uint32_t hunk_file(std::uint32_t hunk) const;
  [[nodiscard]] std::uint32_t hunk_old_start(std::uint32_t hunk) const;
  [[nodiscard]] std::uint32_t hunk_old_lines(std::uint32_t hunk) const;
  [[nodiscard]] std::uint32_t hunk_new_start(std::uint32_t hunk) const;
  [[nodiscard]] std::uint32_t hunk_new_lines(std::uint32_t hunk) const;
  [[nodiscard]] ByteRange hunk_header(std::uint32_t hunk) const;
  [[nodiscard]] std::uint32_t hunk_first_line(std::uint32_t hunk) const;
  [[nodiscard]] std::uint32_t hunk_line_count(std::uint32_t hunk) const;

  [[nodiscard]] LineType line_type(std::uint32_t line) const;
  [[nodiscard]] std::uint32_t line_hunk(std::uint32_t line) const;
  [[nodiscard]] std::uint32_t line_file(std::uint32_t line) const;
  [[nodiscard]] ByteRange line_content(std::uint32_t line) const;
  [[nodiscard]] std::uint32_t line_old_number(std::uint32_t line) const;
  [[nodiscard]] std::uint32_t line_new_number(std::uint32_t line) const;

  // ——— Decoding (copies bytes out of the source; std::logic_error if unset) ———
  [[nodiscard]] std::string decode(ByteRange range) const;
  [[nodiscard]] std::string decode_line_content(std::uint32_t line) const;
  [[nodiscard]] std::string decode_file_path(std::uint32_t file) const;
  [[nodiscard]] std::string decode_file_old_path(std::uint32_t file) const;
  [[nodiscard]] std::string decode_hunk_header(std::uint32_t hunk) const;

  // Line indices of one file, in input order.
  [[nodiscard]] std::vector<std::uint32_t> file_additions(std::uint32_t file) const;
  [[nodiscard]] std::vector<std::uint32_t> file_deletions(std::uint32_t file) const;

  [[nodiscard]] ArenaMemoryStats memory_stats() const;

  // Drop all entries and the source; keep capacity. Bumps generation() so
  // views taken before the reset can tell they are stale.
  void reset();

private:
  void require_source() const;
  void check_file(std::uint32_t file) const;
  void check_hunk(std::uint32_t hunk) const;
  void check_line(std::uint32_t line) const;
  [[nodiscard]] std::vector<std::uint32_t> file_lines_of(std::uint32_t file, LineType type) const;

  void grow_files();
  void grow_hunks();
  void grow_lines();

  SourceBuffer source_;
  bool source_set_ = false;
  std::uint64_t generation_ = 0;

  std::size_t file_count_ = 0;
  std::size_t hunk_count_ = 0;
  std::size_t line_count_ = 0;
  std::size_t file_capacity_;
  std::size_t hunk_capacity_;
  std::size_t line_capacity_;

  // files
  std::vector<std::uint8_t> file_statuses_;
  std::vector<std::uint32_t> file_old_path_offsets_;
  std::vector<std::uint32_t> file_old_path_lengths_;
  std::vector<std::uint32_t> file_new_path_offsets_;
  std::vector<std::uint32_t> file_new_path_lengths_;
  std::vector<std::uint32_t> file_first_hunks_;
  std::vector<std::uint32_t> file_hunk_counts_;

  // hunks
  std::vector<std::uint32_t> hunk_files_;
  std::vector<std::uint32_t> hunk_old_starts_;
  std::vector<std::uint32_t> hunk_old_lines_;
  std::vector<std::uint32_t> hunk_new_starts_;
  std::vector<std::uint32_t> hunk_new_lines_;
  std::vector<std::uint32_t> hunk_header_offsets_;
  std::vector<std::uint32_t> hunk_header_lengths_;
  std::vector<std::uint32_t> hunk_first_lines_;
  std::vector<std::uint32_t> hunk_line_counts_;

  // lines
  std::vector<std::uint8_t> line_types_;
  std::vector<std::uint32_t> line_hunks_;
  std::vector<std::uint32_t> line_files_;
  std::vector<std::uint32_t> line_offsets_;
  std::vector<std::uint32_t> line_lengths_;
  std::vector<std::uint32_t> line_old_numbers_;
  std::vector<std::uint32_t> line_new_numbers_;
};

// Capacity estimate from the input size, to avoid regrowth on typical diffs.
DiffArena make_arena_for_size(std::size_t input_bytes);

} // namespace diffarena
