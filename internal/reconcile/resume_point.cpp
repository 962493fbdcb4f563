#include "internal/reconcile/resume_point.hpp"

#include <algorithm>

namespace payday::reconcile {

void ResumePoint::Handled(uint64_t position) {
  handled_ = std::max(handled_, position);
}

void ResumePoint::Hold(uint64_t position) {
  ++held_[position];
}

void ResumePoint::Release(uint64_t position) {
  auto it = held_.find(position);
  if (it != held_.end() && --it->second == 0) {
    held_.erase(it);
  }
  Handled(position);
}

uint64_t ResumePoint::Committable() const {
  if (held_.empty()) {
    return handled_;
  }
  const auto lowest = held_.begin()->first;
  return std::min(handled_, lowest == 0 ? 0 : lowest - 1);
}

} // namespace payday::reconcile
