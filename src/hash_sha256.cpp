#include "diffarena/hash.hpp"

#include "diffarena/adapter.hpp"
#include "diffarena/consts.hpp"

#include <algorithm>
#include <memory>
#include <openssl/evp.h> // EVP_* digest API
#include <stdexcept>

namespace diffarena::hash {

namespace {

struct CtxFree {
  void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
};

// Incremental SHA-256 so a fingerprint never concatenates the whole diff.
class Sha256 {
public:
  Sha256() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
      throw std::runtime_error("hash: EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
      throw std::runtime_error("hash: EVP_DigestInit_ex(EVP_sha256) failed");
    }
  }

  void update(std::string_view s) {
    if (!s.empty() && EVP_DigestUpdate(ctx_.get(), s.data(), s.size()) != 1) {
      throw std::runtime_error("hash: EVP_DigestUpdate failed");
    }
  }

  // Field terminator; keeps "ab"+"c" apart from "a"+"bc".
  void field(std::string_view s) {
    update(s);
    update(std::string_view("\0", 1));
  }

  void number(std::uint64_t n) { field(std::to_string(n)); }

  digest finish() {
    digest out{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), out.data(), &len) != 1) {
      throw std::runtime_error("hash: EVP_DigestFinal_ex failed");
    }
    if (len != out.size()) {
      throw std::runtime_error("hash: SHA-256 produced unexpected length");
    }
    return out;
  }

private:
  std::unique_ptr<EVP_MD_CTX, CtxFree> ctx_;
};

std::string truncated(const digest &d) {
  return to_hex(d).substr(0, consts::kCacheKeyHexLen);
}

} // namespace

digest sha256(std::span<const std::uint8_t> data) {
  Sha256 h;
  h.update(std::string_view(reinterpret_cast<const char *>(data.data()), data.size()));
  return h.finish();
}

std::string to_hex(std::span<const std::uint8_t> bytes) {
  static constexpr std::array<char, 16> kHex = {'0', '1', '2', '3', '4', '5', '6', '7',
                                                '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};
  std::string s;
  s.resize(bytes.size() * 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    unsigned b = bytes[i];
    s[(2 * i) + 0] = kHex[(b >> 4) & 0xF];
    s[(2 * i) + 1] = kHex[b & 0xF];
  }
  return s;
}

std::string hash_string(std::string_view data) { return truncated(sha256(data)); }

std::string hash_bytes(std::span<const std::uint8_t> data) { return truncated(sha256(data)); }

std::string compute_cache_key(const std::vector<std::string> &components) {
  std::string combined;
  for (std::size_t i = 0; i < components.size(); ++i) {
    if (i > 0) {
      combined.push_back(consts::kKeySeparator);
    }
    combined += components[i];
  }
  return hash_string(combined);
}

std::string fingerprint(const ParseResult &result) {
  const DiffArena &arena = *result.arena;
  const SourceBuffer &src = arena.source();
  Sha256 h;
  h.number(arena.file_count());
  for (std::uint32_t f = 0; f < arena.file_count(); ++f) {
    h.field(to_string(arena.file_status(f)));
    h.field(src.view(arena.file_new_path(f)));
    h.field(arena.file_status(f) == FileStatus::Renamed ? src.view(arena.file_old_path(f))
                                                          : std::string_view{});
    const std::uint32_t first_hunk = arena.file_first_hunk(f);
    const std::uint32_t last_hunk = first_hunk + arena.file_hunk_count(f);
    h.number(last_hunk - first_hunk);
    for (std::uint32_t k = first_hunk; k < last_hunk; ++k) {
      h.number(arena.hunk_old_start(k));
      h.number(arena.hunk_old_lines(k));
      h.number(arena.hunk_new_start(k));
      h.number(arena.hunk_new_lines(k));
      const std::uint32_t first = arena.hunk_first_line(k);
      const std::uint32_t last = first + arena.hunk_line_count(k);
      h.number(last - first);
      for (std::uint32_t i = first; i < last; ++i) {
        h.field(to_string(arena.line_type(i)));
        h.field(src.view(arena.line_content(i)));
      }
    }
  }
  return truncated(h.finish());
}

std::string fingerprint_paths(const ParseResult &result) {
  const auto stats = adapter::get_change_stats(result); // sorted by path
  Sha256 h;
  h.number(stats.size());
  for (const auto &[path, counts] : stats) {
    h.field(path);
    h.number(counts.additions);
    h.number(counts.deletions);
  }
  return truncated(h.finish());
}

} // namespace diffarena::hash
