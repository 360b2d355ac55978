#pragma once

#include <asio.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "download_registry.hpp"
#include "download_types.hpp"
#include "errors.hpp"
#include "history_sink.hpp"
#include "log.hpp"
#include "transport_backend.hpp"

// Owns every download record and is the only place status changes; every
// change is published as a progress snapshot. At most one live record may
// target a given url and directory (or swarm info-hash).
// Public calls are thread-safe, validate synchronously (throwing
// NotFoundError / InvalidStateError / UnsupportedSchemeError /
// InvalidMagnetError) and hand backend work to the io_context.
class DownloadCoordinator {
public:
  struct Options {
    std::chrono::milliseconds sample_interval{1000};
    std::chrono::milliseconds completed_grace{5000};
    std::string default_destination = "downloads";
  };

  using CommandHandler = std::function<void(const OpStatus&)>;
  using ProgressCallback = std::function<void(const DownloadRecord&)>;
  using CompleteCallback = std::function<void(const std::string& id, const std::string& file_name)>;

  DownloadCoordinator(asio::io_context& io,
                      Options options,
                      TransportBackend* http_backend,
                      TransportBackend* peer_backend,
                      std::shared_ptr<HistorySink> history = nullptr,
                      std::shared_ptr<Logger> logger = nullptr);

  // Returns the new id at once; `done` reports whether the transfer started.
  std::string submit(DownloadRequest request, CommandHandler done = nullptr);
  void pause(const std::string& id, CommandHandler done = nullptr);
  void resume(const std::string& id, CommandHandler done = nullptr);
  void cancel(const std::string& id, CommandHandler done = nullptr);
  void retry(const std::string& id, CommandHandler done = nullptr);
  void stop_seeding(const std::string& id, CommandHandler done = nullptr);

  std::vector<DownloadRecord> list() const;
  DownloadRecord get(const std::string& id) const;

  void clear(const std::string& id);
  std::size_t clear_finished();

  // Forgets every record served by backend, whatever its status.
  std::size_t drop_records(const TransportBackend* backend);

  // One sampling round. Runs on the io_context.
  void tick();

  void set_event_callbacks(ProgressCallback on_progress, CompleteCallback on_complete);

  const Options& options() const { return options_; }

private:
  using HandleList = std::vector<std::pair<TransportBackend*, std::string>>;

  struct Outcome {
    std::optional<DownloadRecord> progress;
    std::optional<std::pair<std::string, std::string>> complete;
    std::optional<DownloadRecord> finished;
  };

  TransportBackend* backend_for(TransportKind kind) const;
  void start_transfer(const std::string& id, CommandHandler done);
  void apply_sample(const std::string& id,
                    uint64_t revision,
                    const OpStatus& status,
                    const ProgressSample& sample);
  void on_backend_health(TransportBackend* backend, BackendHealth health);
  void reattach_entry(TransportBackend* backend,
                      const std::string& id,
                      const std::string& handle,
                      const DownloadRequest& request);
  void dispatch(const Outcome& outcome);
  void release_handle(TransportBackend* backend, const std::string& handle);
  // Releases each handle in turn, then runs next.
  void release_then(HandleList handles, std::function<void()> next);

  asio::io_context& io_;
  Options options_;
  TransportBackend* http_backend_;
  TransportBackend* peer_backend_;
  std::shared_ptr<HistorySink> history_;
  std::shared_ptr<Logger> logger_;
  DownloadRegistry registry_;
  ProgressCallback on_progress_;
  CompleteCallback on_complete_;
};
