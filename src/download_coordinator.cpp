#include "download_coordinator.hpp"

#include <algorithm>
#include <filesystem>

#include "magnet_uri.hpp"
#include "url_classifier.hpp"
#include "utils.hpp"

namespace {

using SteadyClock = std::chrono::steady_clock;
using WallClock = DownloadRecord::Clock;

// Statuses the ticker keeps asking the backend about.
bool is_sampled(DownloadStatus status) {
  return status == DownloadStatus::Pending ||
         status == DownloadStatus::Active ||
         status == DownloadStatus::Paused ||
         status == DownloadStatus::Seeding;
}

bool is_closing(DownloadStatus status) {
  return status == DownloadStatus::Cancelling || is_terminal(status);
}

void halt_rates(DownloadRecord& record) {
  record.download_speed = 0;
  record.upload_speed = 0;
  record.eta_seconds.reset();
}

std::string illegal_transition(const char* action, const DownloadRecord& record) {
  return std::string("cannot ") + action + " download " + record.id + " while " + to_string(record.status);
}

// Records with the same target would drive one backend task between them.
std::string transfer_target(TransportKind kind, const DownloadRequest& request) {
  if(kind == TransportKind::Peer) {
    return "swarm:" + parse_magnet(request.url).info_hash;
  }
  auto dir = std::filesystem::path(request.destination).lexically_normal().string();
  while(dir.size() > 1 && dir.back() == '/') dir.pop_back();
  return "http:" + dir + "\n" + request.url;
}

} // namespace

DownloadCoordinator::DownloadCoordinator(asio::io_context& io,
                                         Options options,
                                         TransportBackend* http_backend,
                                         TransportBackend* peer_backend,
                                         std::shared_ptr<HistorySink> history,
                                         std::shared_ptr<Logger> logger)
  : io_(io),
    options_(std::move(options)),
    http_backend_(http_backend),
    peer_backend_(peer_backend),
    history_(std::move(history)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("coordinator")) {
  if(options_.sample_interval.count() <= 0) {
    options_.sample_interval = std::chrono::milliseconds(1000);
  }
  for(auto* backend : {http_backend_, peer_backend_}) {
    if(!backend) continue;
    backend->set_health_listener([this, backend](BackendHealth health){
      on_backend_health(backend, health);
    });
  }
}

void DownloadCoordinator::set_event_callbacks(ProgressCallback on_progress, CompleteCallback on_complete) {
  on_progress_ = std::move(on_progress);
  on_complete_ = std::move(on_complete);
}

TransportBackend* DownloadCoordinator::backend_for(TransportKind kind) const {
  return kind == TransportKind::Peer ? peer_backend_ : http_backend_;
}

namespace {

// Both helpers leave the new snapshot in progress; finished is set once per record.
void enter_terminal(RegistryEntry& entry,
                    DownloadStatus status,
                    std::optional<DownloadRecord>& finished,
                    std::optional<DownloadRecord>& progress) {
  auto& record = entry.record;
  record.status = status;
  halt_rates(record);
  record.updated_at = WallClock::now();
  record.finished_at = record.updated_at;
  if(status == DownloadStatus::Completed && record.total > 0) {
    record.downloaded = record.total;
  }
  if(!entry.history_written) {
    entry.history_written = true;
    finished = record;
  }
  progress = record;
}

void enter_error(RegistryEntry& entry,
                 const OpStatus& status,
                 std::optional<DownloadRecord>& finished,
                 std::optional<DownloadRecord>& progress) {
  entry.record.error = status.describe();
  entry.record.retryable = status.retryable;
  enter_terminal(entry, DownloadStatus::Error, finished, progress);
}

// A live record keeps its target to itself. Finished records still holding
// a backend task give it up; the returned handles must be released before
// the new transfer starts.
std::vector<std::pair<TransportBackend*, std::string>> claim_target(const std::vector<RegistryEntry*>& rivals) {
  for(const auto* rival : rivals) {
    if(!is_terminal(rival->record.status)) {
      throw InvalidStateError(rival->record.request.url + " is already being downloaded as " + rival->record.id);
    }
  }
  std::vector<std::pair<TransportBackend*, std::string>> handoff;
  for(auto* rival : rivals) {
    if(rival->released || rival->record.handle.empty()) continue;
    rival->released = true;
    handoff.emplace_back(rival->backend, rival->record.handle);
  }
  return handoff;
}

} // namespace

std::string DownloadCoordinator::submit(DownloadRequest request, CommandHandler done) {
  auto kind = classify_url(request.url);
  if(kind == TransportKind::Peer) {
    parse_magnet(request.url); // throws InvalidMagnetError
  }
  auto* backend = backend_for(kind);
  if(!backend) {
    throw StartupError(std::string("no ") + to_string(kind) + " transport configured");
  }
  if(request.destination.empty()) {
    request.destination = options_.default_destination.empty() ? "." : options_.default_destination;
  }
  auto target = transfer_target(kind, request);

  DownloadRecord record;
  record.id = make_download_id();
  record.kind = kind;
  record.request = std::move(request);
  record.status = DownloadStatus::Pending;
  record.created_at = WallClock::now();
  record.updated_at = record.created_at;
  std::string id = record.id;

  auto url = record.request.url;
  HandleList handoff;
  registry_.insert(std::move(record), backend, std::move(target), [&](const std::vector<RegistryEntry*>& rivals){
    handoff = claim_target(rivals);
  });
  logger_->info("submitted {} ({}) -> {}", id, to_string(kind), url);

  asio::post(io_, [this, id, handoff = std::move(handoff), done = std::move(done)]() mutable {
    release_then(std::move(handoff), [this, id, done = std::move(done)]() mutable {
      start_transfer(id, std::move(done));
    });
  });
  return id;
}

void DownloadCoordinator::release_then(HandleList handles, std::function<void()> next) {
  if(handles.empty()) {
    next();
    return;
  }
  auto item = std::move(handles.back());
  handles.pop_back();
  logger_->debug("releasing finished task {} before reusing its target", item.second);
  item.first->release(item.second,
    [this, handle = item.second, handles = std::move(handles), next = std::move(next)](const OpStatus& status) mutable {
      if(!status.ok()) logger_->debug("release {}: {}", handle, status.describe());
      release_then(std::move(handles), std::move(next));
    });
}

void DownloadCoordinator::start_transfer(const std::string& id, CommandHandler done) {
  DownloadRequest request;
  TransportBackend* backend = nullptr;
  bool ready = false;
  registry_.update(id, [&](RegistryEntry& entry){
    if(entry.record.status != DownloadStatus::Pending || !entry.record.handle.empty()) return;
    request = entry.record.request;
    backend = entry.backend;
    ready = true;
  });
  if(!ready) {
    if(done) done(OpStatus::success());
    return;
  }

  backend->start(request, [this, id, request, backend, done](const OpStatus& status, const std::string& handle){
    Outcome outcome;
    bool orphaned = status.ok() && !handle.empty();
    registry_.update(id, [&](RegistryEntry& entry){
      auto& record = entry.record;
      if(record.status != DownloadStatus::Pending) return; // cancelled meanwhile
      orphaned = false;
      if(!status.ok()) {
        enter_error(entry, status, outcome.finished, outcome.progress);
        return;
      }
      record.handle = handle;
      record.status = backend->status_after_start();
      record.updated_at = WallClock::now();
      entry.last_good_sample = SteadyClock::now();
      outcome.progress = record;
    });

    if(!status.ok()) {
      logger_->warn("download {} failed to start: {}", id, status.describe());
    }
    if(orphaned) {
      logger_->debug("tearing down task {} started for withdrawn download {}", handle, id);
      backend->cancel(handle, request, request.cleanup, [this, handle](const OpStatus& st){
        if(!st.ok()) logger_->warn("orphan task {}: {}", handle, st.describe());
      });
    }
    dispatch(outcome);
    if(done) done(status);
  });
}

void DownloadCoordinator::pause(const std::string& id, CommandHandler done) {
  Outcome paused;
  DownloadStatus previous = DownloadStatus::Active;
  uint64_t revision = 0;
  std::string handle;
  TransportBackend* backend = nullptr;
  bool found = registry_.update(id, [&](RegistryEntry& entry){
    auto& record = entry.record;
    bool legal = record.status == DownloadStatus::Active ||
                 (record.status == DownloadStatus::Pending && !record.handle.empty());
    if(!legal) throw InvalidStateError(illegal_transition("pause", record));
    previous = record.status;
    record.status = DownloadStatus::Paused;
    halt_rates(record);
    record.updated_at = WallClock::now();
    revision = ++entry.revision;
    entry.settle_until = SteadyClock::now() + 2 * options_.sample_interval;
    handle = record.handle;
    backend = entry.backend;
    paused.progress = record;
  });
  if(!found) throw NotFoundError(id);

  asio::post(io_, [this, id, previous, revision, handle, backend, paused, done]() {
    dispatch(paused);
    backend->pause(handle, [this, id, previous, revision, done](const OpStatus& status){
      Outcome outcome;
      registry_.update(id, [&](RegistryEntry& entry){
        if(entry.revision != revision) return;
        if(status.ok()) {
          entry.settle_until = SteadyClock::now() + 2 * options_.sample_interval;
        } else if(entry.record.status == DownloadStatus::Paused) {
          entry.record.status = previous;
          entry.record.updated_at = WallClock::now();
          outcome.progress = entry.record;
        }
      });
      if(!status.ok()) {
        logger_->warn("pause {} failed: {}", id, status.describe());
      }
      dispatch(outcome);
      if(done) done(status);
    });
  });
}

void DownloadCoordinator::resume(const std::string& id, CommandHandler done) {
  Outcome resumed;
  uint64_t revision = 0;
  std::string handle;
  DownloadRequest request;
  TransportBackend* backend = nullptr;
  bool found = registry_.update(id, [&](RegistryEntry& entry){
    auto& record = entry.record;
    if(record.status != DownloadStatus::Paused) throw InvalidStateError(illegal_transition("resume", record));
    record.status = DownloadStatus::Active;
    record.updated_at = WallClock::now();
    revision = ++entry.revision;
    entry.settle_until = SteadyClock::now() + 2 * options_.sample_interval;
    entry.last_good_sample = SteadyClock::now();
    handle = record.handle;
    request = record.request;
    backend = entry.backend;
    resumed.progress = record;
  });
  if(!found) throw NotFoundError(id);

  asio::post(io_, [this, id, revision, handle, request, backend, resumed, done]() {
    dispatch(resumed);
    backend->resume(handle, request, [this, id, revision, done](const OpStatus& status, const std::string& new_handle){
      Outcome outcome;
      registry_.update(id, [&](RegistryEntry& entry){
        auto& record = entry.record;
        if(status.ok() && !new_handle.empty() && !is_closing(record.status)) {
          record.handle = new_handle;
        }
        if(entry.revision != revision) return;
        if(status.ok()) {
          entry.settle_until = SteadyClock::now() + 2 * options_.sample_interval;
        } else if(record.status == DownloadStatus::Active) {
          record.status = DownloadStatus::Paused;
          record.updated_at = WallClock::now();
          outcome.progress = record;
        }
      });
      if(!status.ok()) {
        logger_->warn("resume {} failed: {}", id, status.describe());
      }
      dispatch(outcome);
      if(done) done(status);
    });
  });
}

void DownloadCoordinator::cancel(const std::string& id, CommandHandler done) {
  Outcome outcome;
  std::string handle;
  DownloadRequest request;
  TransportBackend* backend = nullptr;
  bool discard_only = false;
  bool found = registry_.update(id, [&](RegistryEntry& entry){
    auto& record = entry.record;
    bool legal = record.status == DownloadStatus::Pending ||
                 record.status == DownloadStatus::Active ||
                 record.status == DownloadStatus::Paused ||
                 record.status == DownloadStatus::Error;
    if(!legal) throw InvalidStateError(illegal_transition("cancel", record));
    ++entry.revision;
    request = record.request;
    backend = entry.backend;
    if(record.status == DownloadStatus::Error) {
      // A failed record keeps its status and history entry; cancelling it
      // only discards the backend task and its partial data.
      discard_only = true;
      if(!entry.released) handle = record.handle;
      entry.released = true;
      return;
    }
    handle = record.handle;
    if(handle.empty()) {
      // Nothing reached the backend yet; a late start is torn down on arrival.
      enter_terminal(entry, DownloadStatus::Cancelled, outcome.finished, outcome.progress);
      return;
    }
    record.status = DownloadStatus::Cancelling;
    halt_rates(record);
    record.updated_at = WallClock::now();
    outcome.progress = record;
  });
  if(!found) throw NotFoundError(id);
  if(discard_only) {
    logger_->info("discarding the task of failed download {}", id);
  } else {
    logger_->info("cancelling {}", id);
  }

  if(handle.empty()) {
    asio::post(io_, [this, outcome, done](){
      dispatch(outcome);
      if(done) done(OpStatus::success());
    });
    return;
  }

  asio::post(io_, [this, id, handle, request, backend, discard_only, outcome, done]() {
    dispatch(outcome);
    backend->cancel(handle, request, request.cleanup, [this, id, discard_only, done](const OpStatus& status){
      Outcome cancelled;
      if(!discard_only) {
        registry_.update(id, [&](RegistryEntry& entry){
          if(entry.record.status != DownloadStatus::Cancelling) return;
          entry.released = true;
          enter_terminal(entry, DownloadStatus::Cancelled, cancelled.finished, cancelled.progress);
        });
      }
      if(!status.ok()) {
        logger_->warn("backend cleanup for {} incomplete: {}", id, status.describe());
      }
      dispatch(cancelled);
      if(done) done(OpStatus::success());
    });
  });
}

void DownloadCoordinator::retry(const std::string& id, CommandHandler done) {
  Outcome outcome;
  HandleList handoff;
  bool found = registry_.update_with_rivals(id, [&](RegistryEntry& entry, const std::vector<RegistryEntry*>& rivals){
    auto& record = entry.record;
    if(record.status != DownloadStatus::Error) throw InvalidStateError(illegal_transition("retry", record));
    handoff = claim_target(rivals);
    if(!entry.released && !record.handle.empty()) {
      handoff.emplace_back(entry.backend, record.handle);
    }
    record.handle.clear();
    record.status = DownloadStatus::Pending;
    record.error.clear();
    record.retryable = false;
    record.finished_at.reset();
    record.updated_at = WallClock::now();
    halt_rates(record);
    ++entry.revision;
    entry.history_written = false;
    entry.complete_emitted = false;
    entry.released = false;
    entry.sample_in_flight = false;
    outcome.progress = record;
  });
  if(!found) throw NotFoundError(id);
  logger_->info("retrying {}", id);

  asio::post(io_, [this, id, outcome, handoff = std::move(handoff), done = std::move(done)]() mutable {
    dispatch(outcome);
    release_then(std::move(handoff), [this, id, done = std::move(done)]() mutable {
      start_transfer(id, std::move(done));
    });
  });
}

void DownloadCoordinator::stop_seeding(const std::string& id, CommandHandler done) {
  Outcome outcome;
  std::string handle;
  TransportBackend* backend = nullptr;
  bool found = registry_.update(id, [&](RegistryEntry& entry){
    auto& record = entry.record;
    if(record.status != DownloadStatus::Seeding) throw InvalidStateError(illegal_transition("stop seeding", record));
    ++entry.revision;
    handle = record.handle;
    backend = entry.backend;
    entry.released = true;
    enter_terminal(entry, DownloadStatus::Completed, outcome.finished, outcome.progress);
    if(!entry.complete_emitted) {
      entry.complete_emitted = true;
      outcome.complete = std::make_pair(record.id, record.file_name);
    }
  });
  if(!found) throw NotFoundError(id);
  logger_->info("stopped seeding {}", id);

  asio::post(io_, [this, id, handle, backend, outcome, done]() {
    dispatch(outcome);
    backend->release(handle, [this, id, done](const OpStatus& status){
      if(!status.ok()) {
        logger_->warn("release after seeding {}: {}", id, status.describe());
      }
      if(done) done(status);
    });
  });
}

std::vector<DownloadRecord> DownloadCoordinator::list() const {
  return registry_.snapshot_all();
}

DownloadRecord DownloadCoordinator::get(const std::string& id) const {
  auto record = registry_.snapshot(id);
  if(!record) throw NotFoundError(id);
  return *record;
}

void DownloadCoordinator::release_handle(TransportBackend* backend, const std::string& handle) {
  if(!backend || handle.empty()) return;
  asio::post(io_, [this, backend, handle](){
    backend->release(handle, [this, handle](const OpStatus& status){
      if(!status.ok()) logger_->debug("release {}: {}", handle, status.describe());
    });
  });
}

void DownloadCoordinator::clear(const std::string& id) {
  bool found = false;
  auto removed = registry_.extract_if([&](const RegistryEntry& entry){
    if(entry.record.id != id) return false;
    found = true;
    if(!is_terminal(entry.record.status)) {
      throw InvalidStateError(illegal_transition("clear", entry.record));
    }
    return true;
  });
  if(!found) throw NotFoundError(id);
  for(auto& entry : removed) {
    if(!entry.released) release_handle(entry.backend, entry.record.handle);
  }
}

std::size_t DownloadCoordinator::clear_finished() {
  auto removed = registry_.extract_if([](const RegistryEntry& entry){
    return is_terminal(entry.record.status);
  });
  for(auto& entry : removed) {
    if(!entry.released) release_handle(entry.backend, entry.record.handle);
  }
  if(!removed.empty()) {
    logger_->info("cleared {} finished downloads", removed.size());
  }
  return removed.size();
}

std::size_t DownloadCoordinator::drop_records(const TransportBackend* backend) {
  auto removed = registry_.extract_if([backend](const RegistryEntry& entry){
    return entry.backend == backend;
  });
  if(!removed.empty()) {
    logger_->info("dropped {} records with their transport", removed.size());
  }
  return removed.size();
}

void DownloadCoordinator::tick() {
  struct Job {
    std::string id;
    TransportBackend* backend = nullptr;
    std::string handle;
    uint64_t revision = 0;
  };
  std::vector<Job> jobs;
  HandleList releases;
  std::vector<Outcome> held;

  const auto now = SteadyClock::now();
  const auto wall_now = WallClock::now();
  const auto stale_after = 2 * options_.sample_interval;

  registry_.for_each([&](RegistryEntry& entry){
    auto& record = entry.record;
    if(record.status == DownloadStatus::Completed && !entry.released && !record.handle.empty() &&
       record.finished_at && wall_now - *record.finished_at >= options_.completed_grace) {
      entry.released = true;
      releases.emplace_back(entry.backend, record.handle);
      return;
    }
    if(record.handle.empty() || !is_sampled(record.status)) return;

    if(record.status == DownloadStatus::Active && now - entry.last_good_sample > stale_after) {
      // The backend has gone quiet; don't advertise a transfer we can't see.
      record.status = DownloadStatus::Pending;
      halt_rates(record);
      record.updated_at = wall_now;
      logger_->debug("{} has no fresh sample, holding as pending", record.id);
      held.emplace_back();
      held.back().progress = record;
    }
    if(entry.sample_in_flight) return;
    entry.sample_in_flight = true;
    jobs.push_back({record.id, entry.backend, record.handle, entry.revision});
  });

  for(const auto& outcome : held) dispatch(outcome);
  for(auto& [backend, handle] : releases) {
    logger_->debug("releasing completed task {}", handle);
    release_handle(backend, handle);
  }
  for(auto& job : jobs) {
    auto id = job.id;
    auto revision = job.revision;
    job.backend->sample(job.handle, [this, id, revision](const OpStatus& status, const ProgressSample& sample){
      apply_sample(id, revision, status, sample);
    });
  }
}

void DownloadCoordinator::apply_sample(const std::string& id,
                                       uint64_t revision,
                                       const OpStatus& status,
                                       const ProgressSample& sample) {
  Outcome outcome;
  registry_.update(id, [&](RegistryEntry& entry){
    entry.sample_in_flight = false;
    auto& record = entry.record;
    if(entry.revision != revision || !is_sampled(record.status)) return;

    if(!status.ok()) {
      // Daemon trouble is handled by the stale rule and the health listener.
      if(status.retryable) return;
      enter_error(entry, status, outcome.finished, outcome.progress);
      return;
    }

    const auto now = SteadyClock::now();
    entry.last_good_sample = now;

    bool contradicts =
      (record.status == DownloadStatus::Paused &&
       (sample.status == DownloadStatus::Active || sample.status == DownloadStatus::Pending)) ||
      (record.status == DownloadStatus::Active && sample.status == DownloadStatus::Paused);
    if(contradicts && now < entry.settle_until) return;

    if(sample.total > 0) record.total = sample.total;
    record.downloaded = std::max(record.downloaded, sample.downloaded);
    if(record.total > 0) record.downloaded = std::min(record.downloaded, record.total);
    record.download_speed = sample.download_speed;
    record.upload_speed = sample.upload_speed;
    record.peers = sample.peers;
    record.seeds = sample.seeds;
    if(!sample.file_name.empty()) record.file_name = sample.file_name;
    record.updated_at = WallClock::now();

    switch(sample.status) {
      case DownloadStatus::Completed:
      case DownloadStatus::Cancelled:
        enter_terminal(entry, sample.status, outcome.finished, outcome.progress);
        break;
      case DownloadStatus::Error:
        enter_error(entry,
                    OpStatus::failure(ErrorKind::Transfer,
                                      sample.error.empty() ? std::string("transfer failed") : sample.error),
                    outcome.finished,
                    outcome.progress);
        break;
      case DownloadStatus::Cancelling:
        break;
      default:
        record.status = sample.status;
        if(record.status == DownloadStatus::Paused || record.status == DownloadStatus::Pending) {
          halt_rates(record);
        } else {
          record.eta_seconds = estimate_eta(record.downloaded, record.total, record.download_speed);
        }
        break;
    }

    if(is_file_ready(record) && !entry.complete_emitted) {
      entry.complete_emitted = true;
      outcome.complete = std::make_pair(record.id, record.file_name);
    }
    outcome.progress = record;
  });
  dispatch(outcome);
}

void DownloadCoordinator::on_backend_health(TransportBackend* backend, BackendHealth health) {
  if(health == BackendHealth::Lost) {
    std::vector<Outcome> outcomes;
    registry_.for_each([&](RegistryEntry& entry){
      if(entry.backend != backend || is_closing(entry.record.status)) return;
      ++entry.revision;
      Outcome outcome;
      enter_error(entry,
                  OpStatus::failure(ErrorKind::Startup, "download daemon lost and could not be restarted", true),
                  outcome.finished,
                  outcome.progress);
      outcomes.push_back(std::move(outcome));
    });
    logger_->error("transport lost, {} downloads failed", outcomes.size());
    for(const auto& outcome : outcomes) dispatch(outcome);
    return;
  }

  struct Job {
    std::string id;
    std::string handle;
    DownloadRequest request;
  };
  std::vector<Job> jobs;
  registry_.for_each([&](RegistryEntry& entry){
    if(entry.backend != backend || is_closing(entry.record.status) || entry.record.handle.empty()) return;
    // Samples in flight were aimed at the dead daemon.
    ++entry.revision;
    entry.sample_in_flight = false;
    jobs.push_back({entry.record.id, entry.record.handle, entry.record.request});
  });
  logger_->info("transport recovered, re-attaching {} downloads", jobs.size());
  for(auto& job : jobs) {
    reattach_entry(backend, job.id, job.handle, job.request);
  }
}

void DownloadCoordinator::reattach_entry(TransportBackend* backend,
                                         const std::string& id,
                                         const std::string& handle,
                                         const DownloadRequest& request) {
  backend->reattach(handle, request, [this, backend, id, handle](const OpStatus& status, const std::string& new_handle){
    Outcome outcome;
    bool repause = false;
    registry_.update(id, [&](RegistryEntry& entry){
      auto& record = entry.record;
      if(is_closing(record.status)) return;
      if(!status.ok()) {
        ++entry.revision;
        enter_error(entry, status, outcome.finished, outcome.progress);
        return;
      }
      record.handle = new_handle;
      entry.last_good_sample = SteadyClock::now();
      repause = record.status == DownloadStatus::Paused && new_handle != handle;
    });
    if(!status.ok()) {
      logger_->warn("could not re-attach {}: {}", id, status.describe());
    } else if(new_handle != handle) {
      logger_->info("re-attached {} as {}", id, new_handle);
    }
    if(repause) {
      backend->pause(new_handle, [this, id](const OpStatus& st){
        if(!st.ok()) logger_->warn("re-pausing {}: {}", id, st.describe());
      });
    }
    dispatch(outcome);
  });
}

void DownloadCoordinator::dispatch(const Outcome& outcome) {
  if(outcome.finished && history_) {
    try {
      history_->append(make_history_record(*outcome.finished));
    } catch(const std::exception& e) {
      logger_->error("history append failed: {}", e.what());
    }
  }
  if(outcome.progress && on_progress_) {
    on_progress_(*outcome.progress);
  }
  if(outcome.complete && on_complete_) {
    on_complete_(outcome.complete->first, outcome.complete->second);
  }
}
