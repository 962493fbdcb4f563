#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "internal/eventstore/event_store.hpp"
#include "internal/eventstore/offset_store.hpp"
#include "internal/projection/projection.hpp"

namespace payday::projection {

struct ProjectionRunnerOptions {
  uint32_t poll_interval_ms = 500;
  // events handled between offset commits
  uint32_t commit_every = 256;
};

/*
  Tails the log for each registered projection.

  CatchUp() may be called from any thread; runs are serialized. A
  projection that throws is stopped for this run at the failing event
  and retried on the next one.
*/
class ProjectionRunner {
 public:
  ProjectionRunner(std::shared_ptr<eventstore::EventStore>  events,
                   std::shared_ptr<eventstore::OffsetStore> offsets,
                   ProjectionRunnerOptions                  options = {});
  ~ProjectionRunner();

  void Add(std::shared_ptr<Projection> projection);

  // Feeds everything committed so far. Returns the number of events handled.
  std::size_t CatchUp();

  // Last global position handled by the named projection.
  uint64_t Position(const std::string& name) const;

  void Start();
  void Stop();

 private:
  struct Entry {
    std::shared_ptr<Projection> projection;
    uint64_t                    position = 0;
    bool                        loaded   = false;
  };

  std::size_t CatchUp(Entry& entry);
  void        Run();

  static std::string OffsetId(const Projection& projection);

  std::shared_ptr<eventstore::EventStore>  events_;
  std::shared_ptr<eventstore::OffsetStore> offsets_;
  ProjectionRunnerOptions                  options_;

  mutable std::mutex run_mutex_;
  std::vector<Entry> entries_;

  std::mutex              wait_mutex_;
  std::condition_variable wake_;
  std::thread             thread_;
  std::atomic<bool>       running_{false};
};

} // namespace payday::projection
