#include "diffarena/hash.hpp"
#include "diffarena/parser.hpp"

#include <iostream>
#include <memory>
#include <string>

using namespace diffarena;

int main() {
  // Known SHA-256 vector
  if (hash::to_hex(hash::sha256("abc")) !=
      "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad") {
    std::cerr << "sha256(\"abc\") mismatch\n";
    return 1;
  }
  const std::string key = hash::hash_string("abc");
  if (key.size() != 16 || key != "ba7816bf8f01cfea") {
    std::cerr << "truncated key wrong: " << key << "\n";
    return 1;
  }
  if (hash::compute_cache_key({"a", "bc"}) != hash::hash_string("a:bc") ||
      hash::compute_cache_key({"a", "bc"}) == hash::compute_cache_key({"ab", "c"})) {
    std::cerr << "compute_cache_key join wrong\n";
    return 1;
  }

  const std::string base = "diff --git a/k.txt b/k.txt\n"
                           "--- a/k.txt\n"
                           "+++ b/k.txt\n"
                           "@@ -1,2 +1,2 @@\n"
                           " same\n"
                           "-old\n"
                           "+new\n";
  std::string changed = base;
  changed.replace(changed.rfind("new"), 3, "now");

  StringInternPool pool;
  const auto a = parse_diff_string(base, ParserOptions{.pool = &pool});
  const auto b = parse_diff_string(base, ParserOptions{.pool = &pool});
  const auto c = parse_diff_string(changed, ParserOptions{.pool = &pool});

  if (hash::fingerprint(a) != hash::fingerprint(b) || hash::fingerprint(a).size() != 16) {
    std::cerr << "fingerprint not deterministic\n";
    return 1;
  }
  if (hash::fingerprint(a) == hash::fingerprint(c)) {
    std::cerr << "fingerprint ignores line content\n";
    return 1;
  }
  // Same paths and counts: the path-level key cannot tell them apart
  if (hash::fingerprint_paths(a) != hash::fingerprint_paths(c)) {
    std::cerr << "fingerprint_paths should only see paths and counts\n";
    return 1;
  }

  // Reused arena and a different pool give the same key
  StringInternPool other;
  auto arena = std::make_shared<DiffArena>();
  StreamingDiffParser parser{ParserOptions{.arena = arena, .pool = &other}};
  (void)parser.parse(std::string_view(changed));
  const auto d = parser.parse(std::string_view(base));
  if (hash::fingerprint(d) != hash::fingerprint(a) ||
      hash::fingerprint_paths(d) != hash::fingerprint_paths(a)) {
    std::cerr << "fingerprint depends on arena or pool state\n";
    return 1;
  }

  std::cout << "cache keys test OK\n";
  return 0;
}
