#include "diffarena/intern.hpp"

#include "diffarena/consts.hpp"

namespace diffarena {

namespace {
constexpr std::uint32_t kFnvOffsetBasis = 0x811c9dc5U;
constexpr std::uint32_t kFnvPrime = 0x01000193U;
} // namespace

std::uint32_t fnv1a(std::string_view bytes) {
  std::uint32_t h = kFnvOffsetBasis;
  for (const char c : bytes) {
    h ^= static_cast<std::uint8_t>(c);
    h *= kFnvPrime;
  }
  return h;
}

StringInternPool::StringInternPool() { seed_common(); }

const std::string *StringInternPool::find(std::uint32_t hash, std::string_view value) const {
  const auto it = table_.find(hash);
  if (it == table_.end()) {
    return nullptr;
  }
  for (const auto &entry : it->second) {
    if (*entry == value) {
      return entry.get();
    }
  }
  return nullptr;
}

const std::string &StringInternPool::insert(std::uint32_t hash, std::string_view value) {
  auto &bucket = table_[hash];
  if (!bucket.empty()) {
    ++collisions_; // same hash, different bytes
  }
  bucket.push_back(std::make_unique<const std::string>(value));
  ++unique_;
  return *bucket.back();
}

const std::string &StringInternPool::intern(std::string_view value) {
  const std::uint32_t hash = fnv1a(value);
  if (const std::string *hit = find(hash, value)) {
    ++hits_;
    return *hit;
  }
  ++misses_;
  return insert(hash, value);
}

const std::string &StringInternPool::intern_from_bytes(const std::uint8_t *buffer,
                                                       std::size_t offset, std::size_t length) {
  return intern(std::string_view(reinterpret_cast<const char *>(buffer) + offset, length));
}

bool StringInternPool::has(std::string_view value) const {
  return find(fnv1a(value), value) != nullptr;
}

InternStats StringInternPool::stats() const {
  const std::size_t total = hits_ + misses_;
  return InternStats{
      .unique_strings = unique_,
      .buckets = table_.size(),
      .hits = hits_,
      .misses = misses_,
      .collisions = collisions_,
      .hit_rate = total > 0 ? static_cast<double>(hits_) / static_cast<double>(total) : 0.0,
  };
}

void StringInternPool::clear() {
  table_.clear();
  unique_ = 0;
  hits_ = 0;
  misses_ = 0;
  collisions_ = 0;
  seed_common();
}

void StringInternPool::seed_common() {
  for (const auto path : consts::kCommonPaths) {
    const std::uint32_t hash = fnv1a(path);
    if (find(hash, path) == nullptr) {
      insert(hash, path);
    }
  }
  // Seeding is not a lookup.
  collisions_ = 0;
}

StringInternPool &global_intern_pool() {
  static StringInternPool pool;
  return pool;
}

void reset_global_intern_pool() { global_intern_pool().clear(); }

} // namespace diffarena
