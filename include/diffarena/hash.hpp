#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace diffarena {
struct ParseResult;
}

namespace diffarena::hash {

// Raw 32-byte SHA-256 digest
using digest = std::array<std::uint8_t, 32>;

/** Compute SHA-256 of arbitrary bytes (OpenSSL EVP). */
digest sha256(std::span<const std::uint8_t> data);

// Convenience overload for string-like input (no copy).
inline digest sha256(std::string_view s) {
  return sha256(
      std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(s.data()), s.size()));
}

/** Lowercase hex of arbitrary bytes. */
std::string to_hex(std::span<const std::uint8_t> bytes);

/**
 * Cache-key sized hashes: SHA-256 truncated to consts::kCacheKeyHexLen hex
 * characters (64 bits).
 */
std::string hash_string(std::string_view data);
std::string hash_bytes(std::span<const std::uint8_t> data);

/** Join components with ':' and hash the result. */
std::string compute_cache_key(const std::vector<std::string> &components);

/**
 * Deterministic key over everything a parse produced: per file its status
 * and paths, per hunk its ranges, per line its type and content. Equal input
 * gives equal keys regardless of arena reuse or intern pool state.
 */
std::string fingerprint(const ParseResult &result);

/**
 * Cheaper key over the sorted file paths and their add/delete counts only,
 * for callers that decide on the file list before reading content.
 */
std::string fingerprint_paths(const ParseResult &result);

} // namespace diffarena::hash
