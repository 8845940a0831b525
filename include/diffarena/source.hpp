#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string_view>
#include <vector>

namespace diffarena {

// Byte range into a SourceBuffer.
struct ByteRange {
  std::uint32_t offset = 0;
  std::uint32_t length = 0;

  [[nodiscard]] auto end() const -> std::uint32_t { return offset + length; }
  [[nodiscard]] auto empty() const -> bool { return length == 0; }
  bool operator==(const ByteRange &) const = default;
};

// Immutable bytes of one parse session. Copies share the same storage, so
// ranges handed out by the scanner and arena stay valid as long as any copy
// of the buffer is alive.
class SourceBuffer {
public:
  SourceBuffer();

  static SourceBuffer from_string(std::string_view text);
  static SourceBuffer from_bytes(std::vector<std::uint8_t> bytes);

  [[nodiscard]] auto data() const -> const std::uint8_t * { return bytes_->data(); }
  [[nodiscard]] auto size() const -> std::size_t { return bytes_->size(); }
  [[nodiscard]] auto empty() const -> bool { return bytes_->empty(); }

  // Throws std::out_of_range if the range is not inside the buffer.
  [[nodiscard]] auto view(std::size_t offset, std::size_t length) const -> std::string_view;
  [[nodiscard]] auto view(ByteRange range) const -> std::string_view {
    return view(range.offset, range.length);
  }
  [[nodiscard]] auto bytes(std::size_t offset, std::size_t length) const
      -> std::span<const std::uint8_t>;

  // Same storage (not same content).
  [[nodiscard]] auto shares_storage_with(const SourceBuffer &other) const -> bool {
    return bytes_ == other.bytes_;
  }

private:
  explicit SourceBuffer(std::shared_ptr<const std::vector<std::uint8_t>> bytes);

  std::shared_ptr<const std::vector<std::uint8_t>> bytes_;
};

} // namespace diffarena
