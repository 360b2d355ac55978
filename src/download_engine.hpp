#pragma once

#include <asio.hpp>

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <thread>

#include "log.hpp"

class CommandSurface;
class DaemonLauncher;
class DaemonSupervisor;
class DownloadCoordinator;
class HttpBackend;
class JsonlHistorySink;
class PeerBackend;
class ProgressPublisher;
class SettingsManager;

// Composition root: one io_context on one background thread, plus every
// component built from the settings.
class DownloadEngine {
public:
  struct Options {
    std::filesystem::path workspace_root = std::filesystem::current_path();
    bool enable_peer_backend = true;
    bool search_system_path = true;
    // PosixDaemonLauncher when empty.
    std::function<std::unique_ptr<DaemonLauncher>()> launcher_factory;
  };

  DownloadEngine(std::shared_ptr<SettingsManager> settings, Options options);
  ~DownloadEngine();

  // Throws StartupError when the daemon cannot be brought up. Blocks until
  // the daemon answers; never call from the io thread.
  void start();
  void stop();
  bool started() const { return started_; }

  // Runs one front-end command and returns the JSON reply line.
  std::string execute_command(const std::string& line);

  DownloadCoordinator& coordinator();
  ProgressPublisher& publisher();
  DaemonSupervisor& supervisor();
  std::shared_ptr<JsonlHistorySink> history() const { return history_; }
  std::shared_ptr<SettingsManager> settings() const { return settings_; }
  std::shared_ptr<Logger> logger() const { return logger_; }
  const std::filesystem::path& workspace_root() const { return options_.workspace_root; }
  std::filesystem::path download_dir() const;

  LogListenerHandle add_log_listener(Logger::Listener listener, void* user_data = nullptr);
  void remove_log_listener(LogListenerHandle handle);

private:
  void ensure_workspace() const;
  std::filesystem::path resolve_path(const std::string& value) const;

  Options options_;
  std::shared_ptr<SettingsManager> settings_;
  std::shared_ptr<Logger> logger_;
  std::unique_ptr<asio::io_context> io_;
  std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_;
  std::thread io_thread_;
  std::unique_ptr<DaemonSupervisor> supervisor_;
  std::unique_ptr<HttpBackend> http_backend_;
  std::unique_ptr<PeerBackend> peer_backend_;
  std::shared_ptr<JsonlHistorySink> history_;
  std::unique_ptr<DownloadCoordinator> coordinator_;
  std::unique_ptr<ProgressPublisher> publisher_;
  std::unique_ptr<CommandSurface> commands_;
  bool started_ = false;
};
