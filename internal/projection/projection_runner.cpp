#include "internal/projection/projection_runner.hpp"

#include <chrono>

#include "internal/observability/logging.hpp"

namespace payday::projection {

ProjectionRunner::ProjectionRunner(std::shared_ptr<eventstore::EventStore>  events,
                                   std::shared_ptr<eventstore::OffsetStore> offsets,
                                   ProjectionRunnerOptions                  options)
    : events_(std::move(events)), offsets_(std::move(offsets)), options_(options) {
  if (options_.commit_every == 0) {
    options_.commit_every = 1;
  }
}

ProjectionRunner::~ProjectionRunner() {
  Stop();
}

std::string ProjectionRunner::OffsetId(const Projection& projection) {
  return "projection:" + projection.Name();
}

void ProjectionRunner::Add(std::shared_ptr<Projection> projection) {
  std::lock_guard lock(run_mutex_);
  entries_.push_back(Entry{std::move(projection)});
}

std::size_t ProjectionRunner::CatchUp() {
  std::lock_guard lock(run_mutex_);
  std::size_t     handled = 0;
  for (auto& entry : entries_) {
    handled += CatchUp(entry);
  }
  return handled;
}

std::size_t ProjectionRunner::CatchUp(Entry& entry) {
  auto& projection = *entry.projection;
  if (!entry.loaded) {
    entry.position = projection.Durable() ? offsets_->Get(OffsetId(projection)) : 0;
    entry.loaded   = true;
  }

  std::size_t handled   = 0;
  uint64_t    committed = entry.position;
  auto        cursor    = events_->LoadAllSince(entry.position);

  try {
    while (auto event = cursor.Next()) {
      projection.Handle(*event);
      entry.position = event->global_position;
      ++handled;

      if (projection.Durable() && handled % options_.commit_every == 0) {
        offsets_->Commit(OffsetId(projection), entry.position);
        committed = entry.position;
      }
    }
  } catch (const std::exception& e) {
    PAYDAY_LOG_ERROR("projection stopped", {observability::StringField("projection", projection.Name()),
                                            observability::IntField("position", static_cast<int64_t>(entry.position)),
                                            observability::StringField("error", e.what())});
  }

  if (projection.Durable() && entry.position != committed) {
    offsets_->Commit(OffsetId(projection), entry.position);
  }
  return handled;
}

uint64_t ProjectionRunner::Position(const std::string& name) const {
  std::lock_guard lock(run_mutex_);
  for (const auto& entry : entries_) {
    if (entry.projection->Name() == name) {
      return entry.position;
    }
  }
  return 0;
}

void ProjectionRunner::Start() {
  if (running_.exchange(true)) {
    return;
  }
  thread_ = std::thread(&ProjectionRunner::Run, this);
}

void ProjectionRunner::Stop() {
  {
    std::lock_guard lock(wait_mutex_);
    running_ = false;
  }
  wake_.notify_all();
  if (thread_.joinable())
    thread_.join();
}

void ProjectionRunner::Run() {
  while (running_) {
    try {
      CatchUp();
    } catch (const std::exception& e) {
      PAYDAY_LOG_ERROR("projection run failed", {observability::StringField("error", e.what())});
    }

    std::unique_lock lock(wait_mutex_);
    wake_.wait_for(lock, std::chrono::milliseconds(options_.poll_interval_ms), [this] { return !running_; });
  }
}

} // namespace payday::projection
