#include "diffarena/arena.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace diffarena {

namespace {

constexpr std::size_t kFileEntryBytes = sizeof(std::uint8_t) + (6 * sizeof(std::uint32_t));
constexpr std::size_t kHunkEntryBytes = 9 * sizeof(std::uint32_t);
constexpr std::size_t kLineEntryBytes = sizeof(std::uint8_t) + (6 * sizeof(std::uint32_t));

template <typename T> std::size_t bytes_of(const std::vector<T> &v) { return v.size() * sizeof(T); }

[[noreturn]] void bad_index(const char *what, std::uint32_t index, std::size_t count) {
  throw std::out_of_range(std::string("arena: ") + what + " index " + std::to_string(index) +
                          " out of range (count " + std::to_string(count) + ")");
}

} // namespace

DiffArena::DiffArena(const ArenaOptions &options)
    : file_capacity_(options.file_capacity), hunk_capacity_(options.hunk_capacity),
      line_capacity_(options.line_capacity) {
  if (file_capacity_ == 0 || hunk_capacity_ == 0 || line_capacity_ == 0) {
    throw std::invalid_argument("arena: initial capacities must be positive");
  }

  file_statuses_.resize(file_capacity_);
  file_old_path_offsets_.resize(file_capacity_);
  file_old_path_lengths_.resize(file_capacity_);
  file_new_path_offsets_.resize(file_capacity_);
  file_new_path_lengths_.resize(file_capacity_);
  file_first_hunks_.resize(file_capacity_);
  file_hunk_counts_.resize(file_capacity_);

  hunk_files_.resize(hunk_capacity_);
  hunk_old_starts_.resize(hunk_capacity_);
  hunk_old_lines_.resize(hunk_capacity_);
  hunk_new_starts_.resize(hunk_capacity_);
  hunk_new_lines_.resize(hunk_capacity_);
  hunk_header_offsets_.resize(hunk_capacity_);
  hunk_header_lengths_.resize(hunk_capacity_);
  hunk_first_lines_.resize(hunk_capacity_);
  hunk_line_counts_.resize(hunk_capacity_);

  line_types_.resize(line_capacity_);
  line_hunks_.resize(line_capacity_);
  line_files_.resize(line_capacity_);
  line_offsets_.resize(line_capacity_);
  line_lengths_.resize(line_capacity_);
  line_old_numbers_.resize(line_capacity_);
  line_new_numbers_.resize(line_capacity_);
}

void DiffArena::set_source(SourceBuffer source) {
  source_ = std::move(source);
  source_set_ = true;
}

// Append

std::uint32_t DiffArena::add_file(FileStatus status, ByteRange old_path, ByteRange new_path) {
  if (file_count_ >= file_capacity_) {
    grow_files();
  }
  const auto idx = static_cast<std::uint32_t>(file_count_);
  file_statuses_[idx] = static_cast<std::uint8_t>(status);
  file_old_path_offsets_[idx] = old_path.offset;
  file_old_path_lengths_[idx] = old_path.length;
  file_new_path_offsets_[idx] = new_path.offset;
  file_new_path_lengths_[idx] = new_path.length;
  file_first_hunks_[idx] = static_cast<std::uint32_t>(hunk_count_);
  file_hunk_counts_[idx] = 0;
  ++file_count_;
  return idx;
}

std::uint32_t DiffArena::add_hunk(std::uint32_t file, std::uint32_t old_start,
                                  std::uint32_t old_lines, std::uint32_t new_start,
                                  std::uint32_t new_lines, ByteRange header) {
  check_file(file);
  if (file + 1 != file_count_) {
    throw std::invalid_argument("arena: hunks may only be appended to the last file");
  }
  if (hunk_count_ >= hunk_capacity_) {
    grow_hunks();
  }
  const auto idx = static_cast<std::uint32_t>(hunk_count_);
  hunk_files_[idx] = file;
  hunk_old_starts_[idx] = old_start;
  hunk_old_lines_[idx] = old_lines;
  hunk_new_starts_[idx] = new_start;
  hunk_new_lines_[idx] = new_lines;
  hunk_header_offsets_[idx] = header.offset;
  hunk_header_lengths_[idx] = header.length;
  hunk_first_lines_[idx] = static_cast<std::uint32_t>(line_count_);
  hunk_line_counts_[idx] = 0;
  ++file_hunk_counts_[file];
  ++hunk_count_;
  return idx;
}

std::uint32_t DiffArena::add_line(LineType type, std::uint32_t hunk, ByteRange content,
                                  std::uint32_t old_number, std::uint32_t new_number) {
  check_hunk(hunk);
  if (hunk + 1 != hunk_count_) {
    throw std::invalid_argument("arena: lines may only be appended to the last hunk");
  }
  if (line_count_ >= line_capacity_) {
    grow_lines();
  }
  const auto idx = static_cast<std::uint32_t>(line_count_);
  line_types_[idx] = static_cast<std::uint8_t>(type);
  line_hunks_[idx] = hunk;
  line_files_[idx] = hunk_files_[hunk];
  line_offsets_[idx] = content.offset;
  line_lengths_[idx] = content.length;
  line_old_numbers_[idx] = old_number;
  line_new_numbers_[idx] = new_number;
  ++hunk_line_counts_[hunk];
  ++line_count_;
  return idx;
}

// Refinement

void DiffArena::set_file_status(std::uint32_t file, FileStatus status) {
  check_file(file);
  file_statuses_[file] = static_cast<std::uint8_t>(status);
}

void DiffArena::set_file_old_path(std::uint32_t file, ByteRange path) {
  check_file(file);
  file_old_path_offsets_[file] = path.offset;
  file_old_path_lengths_[file] = path.length;
}

void DiffArena::set_file_new_path(std::uint32_t file, ByteRange path) {
  check_file(file);
  file_new_path_offsets_[file] = path.offset;
  file_new_path_lengths_[file] = path.length;
}

// Columns

void DiffArena::check_file(std::uint32_t file) const {
  if (file >= file_count_)
    bad_index("file", file, file_count_);
}

void DiffArena::check_hunk(std::uint32_t hunk) const {
  if (hunk >= hunk_count_)
    bad_index("hunk", hunk, hunk_count_);
}

void DiffArena::check_line(std::uint32_t line) const {
  if (line >= line_count_)
    bad_index("line", line, line_count_);
}

FileStatus DiffArena::file_status(std::uint32_t file) const {
  check_file(file);
  return static_cast<FileStatus>(file_statuses_[file]);
}

ByteRange DiffArena::file_old_path(std::uint32_t file) const {
  check_file(file);
  return {.offset = file_old_path_offsets_[file], .length = file_old_path_lengths_[file]};
}

ByteRange DiffArena::file_new_path(std::uint32_t file) const {
  check_file(file);
  return {.offset = file_new_path_offsets_[file], .length = file_new_path_lengths_[file]};
}

std::uint32_t DiffArena::file_first_hunk(std::uint32_t file) const {
  check_file(file);
  return file_first_hunks_[file];
}

std::uint32_t DiffArena::file_hunk_count(std::uint32_t file) const {
  check_file(file);
  return file_hunk_counts_[file];
}

std::uint32_t DiffArena::hunk_file(std::uint32_t hunk) const {
  check_hunk(hunk);
  return hunk_files_[hunk];
}

std::uint32_t DiffArena::hunk_old_start(std::uint32_t hunk) const {
  check_hunk(hunk);
  return hunk_old_starts_[hunk];
}

std::uint32_t DiffArena::hunk_old_lines(std::uint32_t hunk) const {
  check_hunk(hunk);
  return hunk_old_lines_[hunk];
}

std::uint32_t DiffArena::hunk_new_start(std::uint32_t hunk) const {
  check_hunk(hunk);
  return hunk_new_starts_[hunk];
}

std::uint32_t DiffArena::hunk_new_lines(std::uint32_t hunk) const {
  check_hunk(hunk);
  return hunk_new_lines_[hunk];
}

ByteRange DiffArena::hunk_header(std::uint32_t hunk) const {
  check_hunk(hunk);
  return {.offset = hunk_header_offsets_[hunk], .length = hunk_header_lengths_[hunk]};
}

std::uint32_t DiffArena::hunk_first_line(std::uint32_t hunk) const {
  check_hunk(hunk);
  return hunk_first_lines_[hunk];
}

std::uint32_t DiffArena::hunk_line_count(std::uint32_t hunk) const {
  check_hunk(hunk);
  return hunk_line_counts_[hunk];
}

LineType DiffArena::line_type(std::uint32_t line) const {
  check_line(line);
  return static_cast<LineType>(line_types_[line]);
}

std::uint32_t DiffArena::line_hunk(std::uint32_t line) const {
  check_line(line);
  return line_hunks_[line];
}

std::uint32_t DiffArena::line_file(std::uint32_t line) const {
  check_line(line);
  return line_files_[line];
}

ByteRange DiffArena::line_content(std::uint32_t line) const {
  check_line(line);
  return {.offset = line_offsets_[line], .length = line_lengths_[line]};
}

std::uint32_t DiffArena::line_old_number(std::uint32_t line) const {
  check_line(line);
  return line_old_numbers_[line];
}

std::uint32_t DiffArena::line_new_number(std::uint32_t line) const {
  check_line(line);
  return line_new_numbers_[line];
}

// Decoding

void DiffArena::require_source() const {
  if (!source_set_) {
    throw std::logic_error("arena: source buffer not set");
  }
}

std::string DiffArena::decode(ByteRange range) const {
  require_source();
  return std::string(source_.view(range));
}

std::string DiffArena::decode_line_content(std::uint32_t line) const {
  return decode(line_content(line));
}

std::string DiffArena::decode_file_path(std::uint32_t file) const {
  return decode(file_new_path(file));
}

std::string DiffArena::decode_file_old_path(std::uint32_t file) const {
  return decode(file_old_path(file));
}

std::string DiffArena::decode_hunk_header(std::uint32_t hunk) const {
  return decode(hunk_header(hunk));
}

std::vector<std::uint32_t> DiffArena::file_lines_of(std::uint32_t file, LineType type) const {
  check_file(file);
  std::vector<std::uint32_t> out;
  const std::uint32_t first = file_first_hunks_[file];
  const std::uint32_t last = first + file_hunk_counts_[file];
  for (std::uint32_t h = first; h < last; ++h) {
    const std::uint32_t begin = hunk_first_lines_[h];
    const std::uint32_t end = begin + hunk_line_counts_[h];
    for (std::uint32_t i = begin; i < end; ++i) {
      if (line_types_[i] == static_cast<std::uint8_t>(type)) {
        out.push_back(i);
      }
    }
  }
  return out;
}

std::vector<std::uint32_t> DiffArena::file_additions(std::uint32_t file) const {
  return file_lines_of(file, LineType::Addition);
}

std::vector<std::uint32_t> DiffArena::file_deletions(std::uint32_t file) const {
  return file_lines_of(file, LineType::Deletion);
}

// Stats / lifecycle

ArenaMemoryStats DiffArena::memory_stats() const {
  ArenaMemoryStats s{};
  s.file_count = file_count_;
  s.hunk_count = hunk_count_;
  s.line_count = line_count_;
  s.file_capacity = file_capacity_;
  s.hunk_capacity = hunk_capacity_;
  s.line_capacity = line_capacity_;

  s.total_bytes = bytes_of(file_statuses_) + bytes_of(file_old_path_offsets_) +
                  bytes_of(file_old_path_lengths_) + bytes_of(file_new_path_offsets_) +
                  bytes_of(file_new_path_lengths_) + bytes_of(file_first_hunks_) +
                  bytes_of(file_hunk_counts_);
  s.total_bytes += bytes_of(hunk_files_) + bytes_of(hunk_old_starts_) +
                   bytes_of(hunk_old_lines_) + bytes_of(hunk_new_starts_) +
                   bytes_of(hunk_new_lines_) + bytes_of(hunk_header_offsets_) +
                   bytes_of(hunk_header_lengths_) + bytes_of(hunk_first_lines_) +
                   bytes_of(hunk_line_counts_);
  s.total_bytes += bytes_of(line_types_) + bytes_of(line_hunks_) + bytes_of(line_files_) +
                   bytes_of(line_offsets_) + bytes_of(line_lengths_) +
                   bytes_of(line_old_numbers_) + bytes_of(line_new_numbers_);

  s.used_bytes = (file_count_ * kFileEntryBytes) + (hunk_count_ * kHunkEntryBytes) +
                 (line_count_ * kLineEntryBytes);
  s.utilization = s.total_bytes == 0
                      ? 0.0
                      : static_cast<double>(s.used_bytes) / static_cast<double>(s.total_bytes);
  return s;
}

void DiffArena::reset() {
  file_count_ = 0;
  hunk_count_ = 0;
  line_count_ = 0;
  source_ = SourceBuffer{};
  source_set_ = false;
  ++generation_;
}

// Growth: double, then copy (vector::resize keeps the prefix in place).

void DiffArena::grow_files() {
  const std::size_t cap = file_capacity_ * 2;
  file_statuses_.resize(cap);
  file_old_path_offsets_.resize(cap);
  file_old_path_lengths_.resize(cap);
  file_new_path_offsets_.resize(cap);
  file_new_path_lengths_.resize(cap);
  file_first_hunks_.resize(cap);
  file_hunk_counts_.resize(cap);
  file_capacity_ = cap;
}

void DiffArena::grow_hunks() {
  const std::size_t cap = hunk_capacity_ * 2;
  hunk_files_.resize(cap);
  hunk_old_starts_.resize(cap);
  hunk_old_lines_.resize(cap);
  hunk_new_starts_.resize(cap);
  hunk_new_lines_.resize(cap);
  hunk_header_offsets_.resize(cap);
  hunk_header_lengths_.resize(cap);
  hunk_first_lines_.resize(cap);
  hunk_line_counts_.resize(cap);
  hunk_capacity_ = cap;
}

void DiffArena::grow_lines() {
  const std::size_t cap = line_capacity_ * 2;
  line_types_.resize(cap);
  line_hunks_.resize(cap);
  line_files_.resize(cap);
  line_offsets_.resize(cap);
  line_lengths_.resize(cap);
  line_old_numbers_.resize(cap);
  line_new_numbers_.resize(cap);
  line_capacity_ = cap;
}

DiffArena make_arena_for_size(std::size_t input_bytes) {
  const std::size_t lines =
      std::max(consts::kMinLineCapacity,
               (input_bytes + consts::kBytesPerLineEstimate - 1) / consts::kBytesPerLineEstimate);
  const std::size_t hunks =
      std::max(consts::kMinHunkCapacity,
               (lines + consts::kLinesPerHunkEstimate - 1) / consts::kLinesPerHunkEstimate);
  const std::size_t files =
      std::max(consts::kMinFileCapacity,
               (hunks + consts::kHunksPerFileEstimate - 1) / consts::kHunksPerFileEstimate);
  return DiffArena{ArenaOptions{
      .line_capacity = lines, .hunk_capacity = hunks, .file_capacity = files}};
}

} // namespace diffarena
