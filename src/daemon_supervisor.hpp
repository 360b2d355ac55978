#pragma once

#include <asio.hpp>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "daemon_process.hpp"
#include "errors.hpp"
#include "json_rpc_client.hpp"
#include "log.hpp"

enum class SupervisorState {
  Stopped,
  Starting,
  Running,
  Respawning,
  Failed
};

enum class DaemonHealth {
  Recovered, // a respawned daemon answers again
  Lost       // the single respawn attempt failed
};

const char* to_string(SupervisorState state);

// Keeps one aria2 daemon alive behind a JSON-RPC endpoint. All work is
// serialized on the io_context; public calls may come from any thread.
class DaemonSupervisor {
public:
  struct Options {
    JsonRpcClient::Endpoint endpoint;
    std::chrono::milliseconds rpc_timeout{10000};
    std::chrono::milliseconds startup_timeout{30000};
    std::chrono::milliseconds shutdown_timeout{5000};
    std::chrono::milliseconds poll_interval{250};
    DaemonSearchPaths search;
    std::filesystem::path download_dir;
    int split = 4;
    int max_connections_per_server = 4;
    int max_concurrent_downloads = 5;
    std::string min_split_size = "1M";
    int64_t download_rate_limit = 0; // bytes/s, 0 = unlimited
  };

  using DoneHandler = std::function<void(const OpStatus&)>;
  using CallHandler = std::function<void(const OpStatus&, const nlohmann::json& result)>;
  using HealthListener = std::function<void(DaemonHealth)>;

  DaemonSupervisor(asio::io_context& io,
                   Options options,
                   std::unique_ptr<DaemonLauncher> launcher,
                   std::shared_ptr<Logger> logger = nullptr);
  ~DaemonSupervisor();

  DaemonSupervisor(const DaemonSupervisor&) = delete;
  DaemonSupervisor& operator=(const DaemonSupervisor&) = delete;

  // Adopts a daemon already answering on the endpoint, otherwise spawns one.
  void initialize(DoneHandler done);
  void is_ready(std::function<void(bool)> handler);
  void shutdown(DoneHandler done);

  // Unreachable daemon => one respawn per death; the failing call still
  // reports its error.
  void call(const std::string& method, nlohmann::json params, CallHandler handler);

  void add_health_listener(HealthListener listener);

  SupervisorState state() const { return state_.load(); }
  bool owns_process() const { return owns_process_.load(); }
  uint64_t respawn_count() const { return respawn_count_.load(); }
  const Options& options() const { return options_; }

  std::vector<std::string> spawn_arguments() const;

private:
  void start_daemon(DoneHandler done);
  void spawn_daemon(DoneHandler done);
  void poll_readiness(std::chrono::steady_clock::time_point deadline, DoneHandler done);
  void handle_daemon_death(uint64_t generation, const std::string& reason);
  void wait_for_exit(std::chrono::steady_clock::time_point deadline, DoneHandler done);
  void notify_health(DaemonHealth health);
  OpStatus classify_ping(const RpcReply& reply) const;

  asio::io_context& io_;
  Options options_;
  std::unique_ptr<DaemonLauncher> launcher_;
  std::shared_ptr<Logger> logger_;
  JsonRpcClient client_;
  asio::steady_timer poll_timer_;
  std::atomic<SupervisorState> state_{SupervisorState::Stopped};
  std::atomic<bool> owns_process_{false};
  std::atomic<uint64_t> respawn_count_{0};
  uint64_t generation_ = 0;
  std::vector<HealthListener> health_listeners_;
};
