#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

#include "internal/db/model/event_record.hpp"

namespace payday::eventstore {

/*
  Lazy, finite cursor over stored events.

  Pages are fetched on demand, each in its own short transaction, so no
  storage lock is held between calls to Next(). Position() is the sequence
  (stream cursor) or global position (log cursor) of the last event
  returned; a new cursor opened after it resumes where this one stopped.
*/
class EventCursor {
 public:
  // (after, limit) -> next page in ascending order
  using PageFn = std::function<std::vector<db::model::EventRecord>(uint64_t after, uint64_t limit)>;
  using KeyFn  = uint64_t (*)(const db::model::EventRecord&);

  EventCursor(PageFn fetch, KeyFn key, uint64_t after, std::size_t batch_size);

  std::optional<db::model::EventRecord> Next();

  uint64_t Position() const {
    return position_;
  }

 private:
  PageFn                          fetch_;
  KeyFn                           key_;
  uint64_t                        position_;
  std::size_t                     batch_size_;
  std::vector<db::model::EventRecord> page_;
  std::size_t                     index_     = 0;
  bool                            exhausted_ = false;
};

} // namespace payday::eventstore
