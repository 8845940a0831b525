#pragma once
#include "diffarena/source.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace diffarena::io {

// Whole file as text; nullopt if it does not exist. Throws std::runtime_error
// if it exists but cannot be read.
std::optional<std::string> read_text(const std::filesystem::path& p);

// Replace `p` with `text` via a sibling temp file and rename; creates parent
// directories.
void write_text_atomic(const std::filesystem::path& p, std::string_view text);

// A saved diff (e.g. `git diff > change.diff`) as a parser input. The bytes
// are moved into the buffer without re-encoding.
SourceBuffer load_source(const std::filesystem::path& p);

} // namespace diffarena::io
