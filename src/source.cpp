#include "diffarena/source.hpp"

#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

namespace diffarena {

namespace {

void check_size(std::size_t n) {
  // Ranges are stored as 32-bit offsets in the arena.
  if (n > std::numeric_limits<std::uint32_t>::max()) {
    throw std::invalid_argument("source: diff larger than 4 GiB is not supported");
  }
}

} // namespace

SourceBuffer::SourceBuffer() : bytes_(std::make_shared<const std::vector<std::uint8_t>>()) {}

SourceBuffer::SourceBuffer(std::shared_ptr<const std::vector<std::uint8_t>> bytes)
    : bytes_(std::move(bytes)) {}

SourceBuffer SourceBuffer::from_string(std::string_view text) {
  check_size(text.size());
  const auto *first = reinterpret_cast<const std::uint8_t *>(text.data());
  return SourceBuffer{
      std::make_shared<const std::vector<std::uint8_t>>(first, first + text.size())};
}

SourceBuffer SourceBuffer::from_bytes(std::vector<std::uint8_t> bytes) {
  check_size(bytes.size());
  return SourceBuffer{std::make_shared<const std::vector<std::uint8_t>>(std::move(bytes))};
}

std::string_view SourceBuffer::view(std::size_t offset, std::size_t length) const {
  if (offset > size() || length > size() - offset) {
    throw std::out_of_range("source: range [" + std::to_string(offset) + ", +" +
                            std::to_string(length) + ") outside buffer of " +
                            std::to_string(size()) + " bytes");
  }
  return {reinterpret_cast<const char *>(data()) + offset, length};
}

std::span<const std::uint8_t> SourceBuffer::bytes(std::size_t offset, std::size_t length) const {
  const auto sv = view(offset, length);
  return {reinterpret_cast<const std::uint8_t *>(sv.data()), sv.size()};
}

} // namespace diffarena
