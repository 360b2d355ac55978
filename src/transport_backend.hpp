#pragma once

#include <functional>
#include <string>

#include "download_types.hpp"
#include "errors.hpp"

enum class BackendHealth {
  Recovered,
  Lost
};

// One transport mechanism. Backends report facts; they never decide a
// record's lifecycle. Every handler runs on the engine's io_context.
class TransportBackend {
public:
  using StartHandler = std::function<void(const OpStatus& status, const std::string& handle)>;
  using StatusHandler = std::function<void(const OpStatus& status)>;
  using SampleHandler = std::function<void(const OpStatus& status, const ProgressSample& sample)>;
  using HealthListener = std::function<void(BackendHealth health)>;

  virtual ~TransportBackend() = default;

  virtual TransportKind kind() const = 0;
  // Status a record takes once start() has handed back a handle.
  virtual DownloadStatus status_after_start() const { return DownloadStatus::Active; }

  virtual void start(const DownloadRequest& request, StartHandler done) = 0;
  virtual void pause(const std::string& handle, StatusHandler done) = 0;
  // May hand back a different handle when the task had to be re-created.
  virtual void resume(const std::string& handle, const DownloadRequest& request, StartHandler done) = 0;
  virtual void cancel(const std::string& handle,
                      const DownloadRequest& request,
                      CleanupPolicy policy,
                      StatusHandler done) = 0;
  virtual void sample(const std::string& handle, SampleHandler done) = 0;
  // Find the task again after the transport restarted underneath it.
  virtual void reattach(const std::string& handle, const DownloadRequest& request, StartHandler done) = 0;
  // Drop the transport's bookkeeping for a finished task; files are kept.
  virtual void release(const std::string& handle, StatusHandler done) = 0;

  virtual void set_health_listener(HealthListener listener) { (void)listener; }
};
