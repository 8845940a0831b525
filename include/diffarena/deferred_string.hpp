#pragma once
#include "diffarena/intern.hpp"
#include "diffarena/source.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace diffarena {

// Text that stays as a byte range until someone reads it. value() interns the
// bytes on first access and memoizes the pooled string; the comparisons work
// on the raw bytes and never force a decode.
//
// Holds its own SourceBuffer handle, so the bytes outlive the arena that
// produced the range. The memoized value follows the pool's lifetime rules.
class DeferredString {
public:
  DeferredString(SourceBuffer source, ByteRange range, StringInternPool *pool = nullptr);

  [[nodiscard]] const std::string &value() const;
  [[nodiscard]] std::string_view view() const { return source_.view(range_); }
  [[nodiscard]] std::size_t byte_length() const { return range_.length; }
  [[nodiscard]] bool is_decoded() const { return cached_ != nullptr; }

  [[nodiscard]] bool equals(std::string_view other) const;
  [[nodiscard]] bool equals(const DeferredString &other) const;
  [[nodiscard]] bool starts_with(std::string_view prefix) const;
  [[nodiscard]] bool ends_with(std::string_view suffix) const;

private:
  SourceBuffer source_;
  ByteRange range_;
  StringInternPool *pool_;
  mutable const std::string *cached_ = nullptr;
};

} // namespace diffarena
