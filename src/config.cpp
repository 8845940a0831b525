#include "diffarena/config.hpp"

#include "diffarena/io.hpp"

#include <charconv>
#include <sstream>
#include <stdexcept>
#include <string_view>

namespace {

std::string trim(std::string_view sv) {
  // left trim spaces/tabs
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t'))
    sv.remove_prefix(1);
  // right trim spaces/tabs/CR
  while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    sv.remove_suffix(1);
  return std::string(sv);
}

std::size_t parse_capacity(std::string_view key, const std::string &value) {
  std::size_t out = 0;
  const auto *first = value.data();
  const auto *last = value.data() + value.size();
  const auto [ptr, ec] = std::from_chars(first, last, out);
  if (ec != std::errc{} || ptr != last || out == 0) {
    throw std::runtime_error("config: " + std::string(key) + " must be a positive integer, got '" +
                             value + "'");
  }
  return out;
}

bool parse_bool(std::string_view key, const std::string &value) {
  if (value == "true" || value == "yes" || value == "1")
    return true;
  if (value == "false" || value == "no" || value == "0")
    return false;
  throw std::runtime_error("config: " + std::string(key) + " must be true or false, got '" +
                           value + "'");
}

} // namespace

namespace diffarena {

auto load_parser_config(const std::filesystem::path &path) -> ParserConfig {
  ParserConfig out{};
  const auto text = io::read_text(path);
  if (!text)
    return out;

  std::istringstream iss(*text);

  std::string line;
  while (std::getline(iss, line)) {
    std::string_view sv{line};
    if (sv.empty() || sv[0] == '#')
      continue; // allow comments
    const auto colon = sv.find(':');
    if (colon == std::string_view::npos)
      continue;
    const std::string key = trim(sv.substr(0, colon));
    const std::string value = trim(sv.substr(colon + 1));

    if (key == "line_capacity") {
      out.capacity.line_capacity = parse_capacity(key, value);
    } else if (key == "hunk_capacity") {
      out.capacity.hunk_capacity = parse_capacity(key, value);
    } else if (key == "file_capacity") {
      out.capacity.file_capacity = parse_capacity(key, value);
    } else if (key == "verbose") {
      out.verbose = parse_bool(key, value);
    } else if (key == "intern_seed") {
      if (!value.empty())
        out.intern_seeds.push_back(value);
    }
  }
  return out;
}

void save_parser_config(const std::filesystem::path &path, const ParserConfig &cfg) {
  std::ostringstream os;
  os << "line_capacity: " << cfg.capacity.line_capacity << '\n'
     << "hunk_capacity: " << cfg.capacity.hunk_capacity << '\n'
     << "file_capacity: " << cfg.capacity.file_capacity << '\n'
     << "verbose: " << (cfg.verbose ? "true" : "false") << '\n';
  for (const auto &seed : cfg.intern_seeds) {
    os << "intern_seed: " << seed << '\n';
  }

  io::write_text_atomic(path, os.str());
}

ParserOptions to_parser_options(const ParserConfig &cfg, StringInternPool *pool) {
  return ParserOptions{
      .arena = nullptr, .pool = pool, .capacity_hints = cfg.capacity, .verbose = cfg.verbose};
}

void apply_seeds(const ParserConfig &cfg, StringInternPool &pool) {
  for (const auto &seed : cfg.intern_seeds) {
    pool.intern(seed);
  }
}

} // namespace diffarena
