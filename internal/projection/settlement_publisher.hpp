#pragma once

#include <cstdint>
#include <functional>
#include <string>

#include "internal/model/payment.hpp"
#include "internal/projection/projection.hpp"

namespace payday::projection {

// Funds that moved: an invoice payment received or an outgoing payment completed.
struct Settlement {
  uint64_t                global_position = 0;
  model::Direction        direction       = model::Direction::kUnspecified;
  std::string             aggregate_id;
  uint64_t                amount_sat    = 0;
  uint64_t                fee_sat       = 0;
  uint64_t                settled_at_ms = 0;
  model::SettlementSource source        = model::SettlementSource::kUnspecified;
};

/*
  Durable projection forwarding settlements to a downstream sink
  (notifications, accounting). Resumes after its committed offset, so the
  sink sees each settlement at least once.
*/
class SettlementPublisher final : public Projection {
 public:
  using Sink = std::function<void(const Settlement&)>;

  explicit SettlementPublisher(Sink sink);

  std::string Name() const override {
    return "settlement_publisher";
  }
  bool Durable() const override {
    return true;
  }

  void Handle(const db::model::EventRecord& event) override;

 private:
  Sink sink_;
};

} // namespace payday::projection
