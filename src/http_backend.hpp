#pragma once

#include <asio.hpp>
#include <nlohmann/json.hpp>

#include <memory>
#include <string>

#include "daemon_supervisor.hpp"
#include "log.hpp"
#include "transport_backend.hpp"

// Segmented HTTP(S) transfers delegated to the aria2 daemon. The handle is
// the daemon's GID.
class HttpBackend : public TransportBackend {
public:
  HttpBackend(asio::io_context& io,
              DaemonSupervisor& supervisor,
              std::shared_ptr<Logger> logger = nullptr);

  TransportKind kind() const override { return TransportKind::Http; }

  void start(const DownloadRequest& request, StartHandler done) override;
  void pause(const std::string& handle, StatusHandler done) override;
  void resume(const std::string& handle, const DownloadRequest& request, StartHandler done) override;
  void cancel(const std::string& handle,
              const DownloadRequest& request,
              CleanupPolicy policy,
              StatusHandler done) override;
  void sample(const std::string& handle, SampleHandler done) override;
  void reattach(const std::string& handle, const DownloadRequest& request, StartHandler done) override;
  void release(const std::string& handle, StatusHandler done) override;

  void set_health_listener(HealthListener listener) override;

  // aria2.tellStatus result -> sample.
  static ProgressSample map_status(const nlohmann::json& status);
  // include_finished also accepts a task the daemon reports as complete.
  static bool task_matches(const nlohmann::json& task, const DownloadRequest& request, bool include_finished);
  static nlohmann::json add_uri_options(const DownloadRequest& request);

private:
  // (status, gid, aria2 status string)
  using FindHandler = std::function<void(const OpStatus&, const std::string&, const std::string&)>;

  void add_uri(const DownloadRequest& request, StartHandler done);
  void discover(const DownloadRequest& request, bool include_finished, FindHandler done);
  void discover_in(std::size_t list_index, const DownloadRequest& request, bool include_finished, FindHandler done);
  void locate(const std::string& gid, const DownloadRequest& request, FindHandler done);
  void unpause_task(const std::string& gid, StartHandler done);
  void remove_result(const std::string& gid, int attempts_left, StatusHandler done);

  asio::io_context& io_;
  DaemonSupervisor& supervisor_;
  std::shared_ptr<Logger> logger_;
  HealthListener health_listener_;
};
