#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace diffarena::consts {

// ——— Line markers ———
inline constexpr std::uint8_t kLF    = '\n';
inline constexpr std::uint8_t kPlus  = '+';
inline constexpr std::uint8_t kMinus = '-';
inline constexpr std::uint8_t kAt    = '@';
inline constexpr std::uint8_t kSpace = ' ';
inline constexpr std::uint8_t kComma = ',';
inline constexpr std::uint8_t kBackslash = '\\';
inline constexpr std::uint8_t kTab   = '\t';

// ——— Line prefixes recognized by the scanner ———
inline constexpr std::string_view kDiffMarker    = "diff ";
inline constexpr std::string_view kGitPrefix     = "--git ";
inline constexpr std::string_view kHunkMarker    = "@@ -";
inline constexpr std::string_view kOldFileMarker = "--- ";
inline constexpr std::string_view kNewFileMarker = "+++ ";
inline constexpr std::string_view kOldFileBare   = "---";
inline constexpr std::string_view kNewFileBare   = "+++";
inline constexpr std::string_view kDevNull       = "/dev/null";

// ——— Extended git header lines (between "diff --git" and the first hunk) ———
inline constexpr std::string_view kNewFileMode     = "new file mode";
inline constexpr std::string_view kDeletedFileMode = "deleted file mode";
inline constexpr std::string_view kRenameFrom      = "rename from ";
inline constexpr std::string_view kRenameTo        = "rename to ";
inline constexpr std::string_view kCopyFrom        = "copy from ";
inline constexpr std::string_view kCopyTo          = "copy to ";
inline constexpr std::string_view kSimilarityIndex = "similarity index";

// ——— Default arena capacities ———
inline constexpr std::size_t kDefaultLineCapacity = 8192;
inline constexpr std::size_t kDefaultHunkCapacity = 512;
inline constexpr std::size_t kDefaultFileCapacity = 128;

// ——— Capacity estimation for make_arena_for_size ———
inline constexpr std::size_t kBytesPerLineEstimate = 40;
inline constexpr std::size_t kLinesPerHunkEstimate = 20;
inline constexpr std::size_t kHunksPerFileEstimate = 3;
inline constexpr std::size_t kMinLineCapacity = 256;
inline constexpr std::size_t kMinHunkCapacity = 32;
inline constexpr std::size_t kMinFileCapacity = 16;

// ——— Intern pool seeds (paths that show up in most diffs) ———
inline constexpr std::array<std::string_view, 11> kCommonPaths = {
    "package.json", "package-lock.json", "pnpm-lock.yaml", "bun.lockb",
    "yarn.lock",    "tsconfig.json",     "README.md",      ".gitignore",
    ".env",         ".env.local",        "/dev/null",
};

// ——— Cache keys ———
inline constexpr std::size_t kCacheKeyHexLen = 16; // 64 bits of SHA-256
inline constexpr char kKeySeparator = ':';

} // namespace diffarena::consts
