#pragma once
#include "diffarena/arena.hpp"
#include "diffarena/intern.hpp"
#include "diffarena/parser.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace diffarena {

struct ParserConfig {
  ArenaOptions capacity{};
  bool verbose = false;
  std::vector<std::string> intern_seeds; // extra paths to pre-intern
};

// Read "key: value" lines (defaults if the file is missing). Keys:
//   line_capacity, hunk_capacity, file_capacity, verbose, intern_seed (repeatable)
// Throws std::runtime_error on a malformed number or boolean.
ParserConfig load_parser_config(const std::filesystem::path& path);

// Overwrite `path` with the given config
void save_parser_config(const std::filesystem::path& path, const ParserConfig& cfg);

// Options for StreamingDiffParser with capacities and verbosity from `cfg`.
ParserOptions to_parser_options(const ParserConfig& cfg, StringInternPool* pool = nullptr);

// Intern cfg.intern_seeds into `pool`.
void apply_seeds(const ParserConfig& cfg, StringInternPool& pool);

} // namespace diffarena
