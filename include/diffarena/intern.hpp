#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace diffarena {

struct InternStats {
  std::size_t unique_strings = 0;
  std::size_t buckets = 0;
  std::size_t hits = 0;
  std::size_t misses = 0;
  std::size_t collisions = 0;
  double hit_rate = 0.0;
};

// FNV-1a, 32 bit.
std::uint32_t fnv1a(std::string_view bytes);

// Deduplicates decoded strings, chiefly file paths. Every distinct byte
// sequence is stored once; intern() hands back a reference to that copy.
// References stay valid (and unchanged) until clear() or destruction.
class StringInternPool {
public:
  StringInternPool();

  const std::string &intern(std::string_view value);
  const std::string &intern_from_bytes(const std::uint8_t *buffer, std::size_t offset,
                                       std::size_t length);

  [[nodiscard]] bool has(std::string_view value) const;
  [[nodiscard]] InternStats stats() const;

  // Empty the pool and reset counters, then re-seed the common paths.
  void clear();

private:
  const std::string *find(std::uint32_t hash, std::string_view value) const;
  const std::string &insert(std::uint32_t hash, std::string_view value);
  void seed_common();

  // hash -> entries; unique_ptr keeps each string's address fixed while the
  // bucket vector grows.
  std::unordered_map<std::uint32_t, std::vector<std::unique_ptr<const std::string>>> table_;
  std::size_t unique_ = 0;
  std::size_t hits_ = 0;
  std::size_t misses_ = 0;
  std::size_t collisions_ = 0;
};

// Process-wide default pool. Not synchronized: concurrent parses must pass
// their own pool.
StringInternPool &global_intern_pool();
void reset_global_intern_pool();

} // namespace diffarena
