#pragma once

#include <string>

#include "internal/db/model/event_record.hpp"

namespace payday::projection {

/*
  Consumer of the global event log.

  Delivery is at-least-once: after a restart a durable projection sees
  again whatever it handled after its last committed offset.
*/
class Projection {
 public:
  virtual ~Projection() = default;

  // Offset id is "projection:<Name()>".
  virtual std::string Name() const = 0;

  // Durable projections resume from their committed offset; the others
  // keep state in memory and rebuild from the start of the log.
  virtual bool Durable() const = 0;

  virtual void Handle(const db::model::EventRecord& event) = 0;
};

} // namespace payday::projection
