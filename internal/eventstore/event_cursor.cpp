#include "internal/eventstore/event_cursor.hpp"

namespace payday::eventstore {

EventCursor::EventCursor(PageFn fetch, KeyFn key, uint64_t after, std::size_t batch_size)
    : fetch_(std::move(fetch)), key_(key), position_(after), batch_size_(batch_size == 0 ? 1 : batch_size) {
}

std::optional<db::model::EventRecord> EventCursor::Next() {
  if (index_ >= page_.size()) {
    if (exhausted_) {
      return std::nullopt;
    }

    page_  = fetch_(position_, batch_size_);
    index_ = 0;
    // a short page means the end of what was committed when it was read
    exhausted_ = page_.size() < batch_size_;
    if (page_.empty()) {
      return std::nullopt;
    }
  }

  auto event = std::move(page_[index_++]);
  position_  = key_(event);
  return event;
}

} // namespace payday::eventstore
