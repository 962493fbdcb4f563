#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/model/payment.hpp"
#include "internal/projection/projection.hpp"

namespace payday::projection {

/*
  In-memory read model of every aggregate's current state, folded with the
  same reducer the command path uses. Rebuilt from the start of the log on
  each process start.
*/
class PaymentStatusView final : public Projection {
 public:
  std::string Name() const override {
    return "payment_status_view";
  }
  bool Durable() const override {
    return false;
  }

  void Handle(const db::model::EventRecord& event) override;

  std::optional<model::Payment> Get(model::Direction direction, const std::string& id) const;

  // Invoices still awaiting payment whose expiry is at or before now_ms,
  // leaving out those with an on-chain payment pending.
  std::vector<model::Payment> Overdue(uint64_t now_ms) const;

  std::vector<model::Payment> WithStatus(model::Direction direction, model::PaymentStatus status) const;

  std::size_t Size() const;

 private:
  mutable std::mutex                              mutex_;
  std::unordered_map<std::string, model::Payment> payments_;
};

} // namespace payday::projection
