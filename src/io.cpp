#include "diffarena/io.hpp"

#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace diffarena::io {

namespace {

template <typename Container> Container slurp(const fs::path &p) {
  std::ifstream in(p, std::ios::binary);
  if (!in) {
    throw std::runtime_error("io: cannot open " + p.string());
  }
  Container out((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    throw std::runtime_error("io: read error on " + p.string());
  }
  return out;
}

} // namespace

std::optional<std::string> read_text(const fs::path &p) {
  std::error_code ec;
  if (!fs::is_regular_file(p, ec)) {
    return std::nullopt;
  }
  return slurp<std::string>(p);
}

void write_text_atomic(const fs::path &p, std::string_view text) {
  std::error_code ec;
  if (p.has_parent_path()) {
    fs::create_directories(p.parent_path(), ec);
    if (ec) {
      throw std::runtime_error("io: cannot create " + p.parent_path().string() + ": " +
                               ec.message());
    }
  }

  fs::path tmp = p;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    out.write(text.data(), static_cast<std::streamsize>(text.size()));
    out.flush();
    if (!out) {
      throw std::runtime_error("io: cannot write " + tmp.string());
    }
  }
  fs::rename(tmp, p, ec);
  if (ec) {
    fs::remove(tmp, ec);
    throw std::runtime_error("io: cannot replace " + p.string());
  }
}

SourceBuffer load_source(const fs::path &p) {
  return SourceBuffer::from_bytes(slurp<std::vector<std::uint8_t>>(p));
}

} // namespace diffarena::io
