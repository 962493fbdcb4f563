#pragma once

#include <cstddef>
#include <cstdint>
#include <map>

namespace payday::reconcile {

/*
  Resume point of one notification source (a node's settle index, a
  chain's block height).

  Positions are marked handled as they are processed. A held position is
  one whose notification has not been applied yet; the committable point
  stays below the lowest held position until it is released, so a restart
  replays it.
*/
class ResumePoint {
 public:
  void Handled(uint64_t position);

  // Holds may nest; each Hold needs its own Release.
  void Hold(uint64_t position);
  void Release(uint64_t position);

  // Highest position that can be committed without skipping a held one.
  uint64_t Committable() const;

  bool Holding() const {
    return !held_.empty();
  }

 private:
  uint64_t                        handled_ = 0;
  std::map<uint64_t, std::size_t> held_;
};

} // namespace payday::reconcile
