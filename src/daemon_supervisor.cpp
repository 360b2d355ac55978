#include "daemon_supervisor.hpp"

#include <utility>

using json = nlohmann::json;

const char* to_string(SupervisorState state) {
  switch(state) {
    case SupervisorState::Stopped: return "stopped";
    case SupervisorState::Starting: return "starting";
    case SupervisorState::Running: return "running";
    case SupervisorState::Respawning: return "respawning";
    case SupervisorState::Failed: return "failed";
  }
  return "unknown";
}

namespace {

std::string endpoint_name(const JsonRpcClient::Endpoint& endpoint) {
  return endpoint.host + ":" + std::to_string(endpoint.port);
}

OpStatus status_from_reply(const RpcReply& reply) {
  if(reply.success) return OpStatus::success();
  if(reply.timed_out) {
    return OpStatus::failure(ErrorKind::RpcTimeout, reply.error, true);
  }
  if(reply.transport_error) {
    return OpStatus::failure(ErrorKind::Transfer, "daemon unreachable: " + reply.error, true);
  }
  if(reply.protocol_error) {
    return OpStatus::failure(ErrorKind::Transfer, "bad daemon reply: " + reply.error);
  }
  return OpStatus::failure(ErrorKind::Transfer, reply.error);
}

} // namespace

DaemonSupervisor::DaemonSupervisor(asio::io_context& io,
                                   Options options,
                                   std::unique_ptr<DaemonLauncher> launcher,
                                   std::shared_ptr<Logger> logger)
  : io_(io),
    options_(std::move(options)),
    launcher_(launcher ? std::move(launcher) : std::make_unique<PosixDaemonLauncher>()),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("daemon")),
    client_(io, options_.endpoint, options_.rpc_timeout, logger_),
    poll_timer_(io) {}

DaemonSupervisor::~DaemonSupervisor() {
  if(owns_process_ && launcher_) {
    launcher_->kill();
  }
}

std::vector<std::string> DaemonSupervisor::spawn_arguments() const {
  std::vector<std::string> args = {
    "--enable-rpc",
    "--rpc-listen-all=false",
    "--rpc-listen-port=" + std::to_string(options_.endpoint.port),
    "--file-allocation=none",
    "--allow-overwrite=true",
    "--auto-file-renaming=false",
    "--continue=true",
    "--max-concurrent-downloads=" + std::to_string(options_.max_concurrent_downloads),
    "--max-connection-per-server=" + std::to_string(options_.max_connections_per_server),
    "--split=" + std::to_string(options_.split),
    "--min-split-size=" + options_.min_split_size,
    "--disable-ipv6=true"
  };
  if(!options_.download_dir.empty()) {
    args.push_back("--dir=" + options_.download_dir.string());
  }
  if(options_.download_rate_limit > 0) {
    args.push_back("--max-overall-download-limit=" + std::to_string(options_.download_rate_limit));
  }
  if(!options_.endpoint.secret.empty()) {
    args.push_back("--rpc-secret=" + options_.endpoint.secret);
  }
  return args;
}

void DaemonSupervisor::add_health_listener(HealthListener listener) {
  asio::post(io_, [this, listener = std::move(listener)]() mutable {
    health_listeners_.push_back(std::move(listener));
  });
}

void DaemonSupervisor::notify_health(DaemonHealth health) {
  for(auto& listener : health_listeners_) {
    if(listener) listener(health);
  }
}

OpStatus DaemonSupervisor::classify_ping(const RpcReply& reply) const {
  if(reply.success) {
    if(reply.result.is_object() && reply.result.contains("version")) {
      return OpStatus::success();
    }
    return OpStatus::failure(ErrorKind::Startup,
      "endpoint " + endpoint_name(options_.endpoint) + " answered getVersion without a version");
  }
  if(reply.daemon_unreachable()) {
    return OpStatus::failure(ErrorKind::Transfer, reply.error, true);
  }
  if(reply.protocol_error) {
    return OpStatus::failure(ErrorKind::Startup,
      "endpoint " + endpoint_name(options_.endpoint) + " is bound by an incompatible process: " + reply.error);
  }
  return OpStatus::failure(ErrorKind::Startup,
    "endpoint " + endpoint_name(options_.endpoint) + " rejected the request: " + reply.error);
}

void DaemonSupervisor::initialize(DoneHandler done) {
  asio::post(io_, [this, done = std::move(done)]() mutable {
    auto current = state_.load();
    if(current == SupervisorState::Running) {
      if(done) done(OpStatus::success());
      return;
    }
    if(current == SupervisorState::Starting || current == SupervisorState::Respawning) {
      if(done) done(OpStatus::failure(ErrorKind::InvalidState, "daemon startup already in progress"));
      return;
    }
    state_ = SupervisorState::Starting;
    start_daemon([this, done = std::move(done)](const OpStatus& status){
      auto expected = SupervisorState::Starting;
      state_.compare_exchange_strong(expected,
        status.ok() ? SupervisorState::Running : SupervisorState::Failed);
      if(status.ok()) {
        ++generation_;
        logger_->info("aria2 ready on {} ({})",
                      endpoint_name(options_.endpoint),
                      owns_process_ ? "spawned" : "adopted");
      } else {
        logger_->error("aria2 startup failed: {}", status.message);
      }
      if(done) done(status);
    });
  });
}

void DaemonSupervisor::start_daemon(DoneHandler done) {
  client_.call_once("aria2.getVersion", json::array(),
    [this, done = std::move(done)](const RpcReply& reply) mutable {
      auto ping = classify_ping(reply);
      if(ping.ok()) {
        owns_process_ = false;
        done(OpStatus::success());
        return;
      }
      if(ping.kind == ErrorKind::Startup) {
        done(ping);
        return;
      }
      spawn_daemon(std::move(done));
    });
}

void DaemonSupervisor::spawn_daemon(DoneHandler done) {
  auto binary = locate_daemon_binary(options_.search);
  if(!binary) {
    done(OpStatus::failure(ErrorKind::Startup,
      "no " + options_.search.binary_name + " binary found (set daemon_path)", true));
    return;
  }

  if(!options_.download_dir.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(options_.download_dir, ec);
  }

  try {
    launcher_->launch(*binary, spawn_arguments());
  } catch(const DownloadError& e) {
    done(OpStatus::from(e));
    return;
  }
  owns_process_ = true;
  logger_->info("spawned {} listening on port {}", binary->string(), options_.endpoint.port);
  poll_readiness(std::chrono::steady_clock::now() + options_.startup_timeout, std::move(done));
}

void DaemonSupervisor::poll_readiness(std::chrono::steady_clock::time_point deadline, DoneHandler done) {
  if(!launcher_->running()) {
    owns_process_ = false;
    done(OpStatus::failure(ErrorKind::Startup, "aria2 exited during startup", true));
    return;
  }
  client_.call_once("aria2.getVersion", json::array(),
    [this, deadline, done = std::move(done)](const RpcReply& reply) mutable {
      auto ping = classify_ping(reply);
      if(ping.ok()) {
        done(OpStatus::success());
        return;
      }
      if(ping.kind == ErrorKind::Startup) {
        launcher_->kill();
        owns_process_ = false;
        done(ping);
        return;
      }
      if(std::chrono::steady_clock::now() >= deadline) {
        launcher_->kill();
        owns_process_ = false;
        done(OpStatus::failure(ErrorKind::Startup,
          "aria2 did not answer within " + std::to_string(options_.startup_timeout.count()) + "ms", true));
        return;
      }
      poll_timer_.expires_after(options_.poll_interval);
      poll_timer_.async_wait([this, deadline, done = std::move(done)](const std::error_code& ec) mutable {
        if(ec) {
          done(OpStatus::failure(ErrorKind::Startup, "startup aborted"));
          return;
        }
        poll_readiness(deadline, std::move(done));
      });
    });
}

void DaemonSupervisor::is_ready(std::function<void(bool)> handler) {
  client_.call_once("aria2.getVersion", json::array(), [this, handler = std::move(handler)](const RpcReply& reply){
    if(handler) handler(classify_ping(reply).ok());
  });
}

void DaemonSupervisor::call(const std::string& method, json params, CallHandler handler) {
  asio::post(io_, [this, method, params = std::move(params), handler = std::move(handler)]() mutable {
    switch(state_.load()) {
      case SupervisorState::Running:
        break;
      case SupervisorState::Starting:
      case SupervisorState::Respawning:
        if(handler) handler(OpStatus::failure(ErrorKind::Transfer, "daemon restarting", true), json());
        return;
      case SupervisorState::Failed:
        if(handler) handler(OpStatus::failure(ErrorKind::Startup, "daemon unavailable"), json());
        return;
      case SupervisorState::Stopped:
        if(handler) handler(OpStatus::failure(ErrorKind::Startup, "daemon not started"), json());
        return;
    }
    const uint64_t generation = generation_;
    client_.call(method, std::move(params),
      [this, method, generation, handler = std::move(handler)](const RpcReply& reply){
        if(reply.daemon_unreachable()) {
          handle_daemon_death(generation, method + ": " + reply.error);
        }
        if(handler) handler(status_from_reply(reply), reply.result);
      });
  });
}

void DaemonSupervisor::handle_daemon_death(uint64_t generation, const std::string& reason) {
  // Calls issued against an earlier daemon don't count as a new death.
  if(generation != generation_ || state_.load() != SupervisorState::Running) return;

  state_ = SupervisorState::Respawning;
  ++respawn_count_;
  logger_->warn("aria2 unreachable ({}), respawning", reason);
  if(owns_process_) {
    launcher_->kill();
    owns_process_ = false;
  }
  start_daemon([this](const OpStatus& status){
    if(state_.load() != SupervisorState::Respawning) return; // shut down meanwhile
    if(status.ok()) {
      ++generation_;
      state_ = SupervisorState::Running;
      logger_->info("aria2 recovered");
      notify_health(DaemonHealth::Recovered);
    } else {
      state_ = SupervisorState::Failed;
      logger_->error("aria2 respawn failed: {}", status.message);
      notify_health(DaemonHealth::Lost);
    }
  });
}

void DaemonSupervisor::shutdown(DoneHandler done) {
  asio::post(io_, [this, done = std::move(done)]() mutable {
    std::error_code ignored;
    poll_timer_.cancel(ignored);
    auto previous = state_.exchange(SupervisorState::Stopped);
    if(!owns_process_) {
      if(done) done(OpStatus::success());
      return;
    }
    auto deadline = std::chrono::steady_clock::now() + options_.shutdown_timeout;
    if(previous != SupervisorState::Running) {
      launcher_->kill();
      owns_process_ = false;
      if(done) done(OpStatus::success());
      return;
    }
    client_.call_once("aria2.shutdown", json::array(),
      [this, deadline, done = std::move(done)](const RpcReply& reply) mutable {
        if(!reply.success) {
          logger_->debug("aria2.shutdown: {}", reply.error);
          launcher_->terminate();
        }
        wait_for_exit(deadline, std::move(done));
      });
  });
}

void DaemonSupervisor::wait_for_exit(std::chrono::steady_clock::time_point deadline, DoneHandler done) {
  if(!launcher_->running()) {
    owns_process_ = false;
    logger_->info("aria2 stopped");
    if(done) done(OpStatus::success());
    return;
  }
  if(std::chrono::steady_clock::now() >= deadline) {
    logger_->warn("aria2 ignored shutdown, killing it");
    launcher_->kill();
    owns_process_ = false;
    if(done) done(OpStatus::success());
    return;
  }
  poll_timer_.expires_after(std::chrono::milliseconds(100));
  poll_timer_.async_wait([this, deadline, done = std::move(done)](const std::error_code&) mutable {
    wait_for_exit(deadline, std::move(done));
  });
}
