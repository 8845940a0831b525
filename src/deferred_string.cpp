#include "diffarena/deferred_string.hpp"

#include <utility>

namespace diffarena {

DeferredString::DeferredString(SourceBuffer source, ByteRange range, StringInternPool *pool)
    : source_(std::move(source)), range_(range),
      pool_(pool != nullptr ? pool : &global_intern_pool()) {
  // Validate once so later reads cannot step outside the buffer.
  (void)source_.view(range_);
}

const std::string &DeferredString::value() const {
  if (cached_ == nullptr) {
    cached_ = &pool_->intern_from_bytes(source_.data(), range_.offset, range_.length);
  }
  return *cached_;
}

bool DeferredString::equals(std::string_view other) const {
  if (cached_ != nullptr) {
    return *cached_ == other;
  }
  return view() == other;
}

bool DeferredString::equals(const DeferredString &other) const {
  return view() == other.view();
}

bool DeferredString::starts_with(std::string_view prefix) const {
  return view().starts_with(prefix);
}

bool DeferredString::ends_with(std::string_view suffix) const {
  return view().ends_with(suffix);
}

} // namespace diffarena
