#include "download_engine.hpp"

#include <future>
#include <stdexcept>

#include "command_surface.hpp"
#include "daemon_process.hpp"
#include "daemon_supervisor.hpp"
#include "download_coordinator.hpp"
#include "errors.hpp"
#include "history_sink.hpp"
#include "http_backend.hpp"
#include "peer_backend.hpp"
#include "progress_publisher.hpp"
#include "settings_manager.hpp"

namespace {

// Blocks the calling thread until an io-side operation reports back.
OpStatus wait_for(std::function<void(std::function<void(const OpStatus&)>)> operation,
                  std::chrono::milliseconds timeout,
                  const std::string& what) {
  auto promise = std::make_shared<std::promise<OpStatus>>();
  auto future = promise->get_future();
  operation([promise](const OpStatus& status){
    try {
      promise->set_value(status);
    } catch(const std::future_error&) {
      // already satisfied
    }
  });
  if(future.wait_for(timeout) != std::future_status::ready) {
    return OpStatus::failure(ErrorKind::RpcTimeout, what + " did not finish in time", true);
  }
  return future.get();
}

} // namespace

DownloadEngine::DownloadEngine(std::shared_ptr<SettingsManager> settings, Options options)
  : options_(std::move(options)),
    settings_(settings ? std::move(settings) : std::make_shared<SettingsManager>()),
    logger_(std::make_shared<Logger>("haul")) {
  if(options_.workspace_root.empty()) {
    options_.workspace_root = std::filesystem::current_path();
  }
}

DownloadEngine::~DownloadEngine() {
  stop();
}

void DownloadEngine::ensure_workspace() const {
  std::error_code ec;
  std::filesystem::create_directories(options_.workspace_root, ec);
}

std::filesystem::path DownloadEngine::resolve_path(const std::string& value) const {
  std::filesystem::path path(value);
  if(path.empty() || path.is_absolute()) return path;
  return options_.workspace_root / path;
}

std::filesystem::path DownloadEngine::download_dir() const {
  return resolve_path(settings_->get<std::string>("download_dir"));
}

void DownloadEngine::start() {
  if(started_) return;

  ensure_workspace();
  if(settings_->settings_path().empty()) {
    settings_->set_settings_path(options_.workspace_root / ".config" / "settings.json");
  }
  init(settings_->get<bool>("verbose"), settings_->get<std::string>("log_file"));

  DaemonSupervisor::Options daemon;
  daemon.endpoint.host = settings_->get<std::string>("rpc_host");
  daemon.endpoint.port = static_cast<uint16_t>(settings_->get<int>("rpc_port"));
  daemon.endpoint.secret = settings_->get<std::string>("rpc_secret");
  daemon.rpc_timeout = settings_->get_ms("rpc_timeout_ms");
  daemon.startup_timeout = settings_->get_ms("startup_timeout_ms");
  daemon.shutdown_timeout = settings_->get_ms("shutdown_timeout_ms");
  daemon.search.explicit_path = resolve_path(settings_->get<std::string>("daemon_path"));
  daemon.search.resource_dir = resolve_path(settings_->get<std::string>("resource_dir"));
  daemon.search.working_dir = options_.workspace_root;
  daemon.search.search_system_path = options_.search_system_path;
  daemon.download_dir = download_dir();
  daemon.split = settings_->get<int>("split");
  daemon.max_connections_per_server = settings_->get<int>("max_connections_per_server");
  daemon.max_concurrent_downloads = settings_->get<int>("max_concurrent_downloads");
  daemon.min_split_size = std::to_string(settings_->get<int64_t>("min_split_size"));
  daemon.download_rate_limit = settings_->get<int64_t>("download_rate_limit");

  // Fresh per run so nothing queued by a previous run can fire.
  io_ = std::make_unique<asio::io_context>();
  auto& io = *io_;

  auto launcher = options_.launcher_factory
    ? options_.launcher_factory()
    : std::make_unique<PosixDaemonLauncher>();
  supervisor_ = std::make_unique<DaemonSupervisor>(io, daemon, std::move(launcher), logger_->child("daemon"));
  http_backend_ = std::make_unique<HttpBackend>(io, *supervisor_, logger_->child("http"));

  if(options_.enable_peer_backend) {
    PeerBackend::Options peer;
    peer.listen_port = static_cast<uint16_t>(settings_->get<int>("peer_listen_port"));
    peer.max_connections = settings_->get<int>("peer_max_connections");
    peer.enable_dht = settings_->get<bool>("enable_dht");
    peer.enable_lsd = settings_->get<bool>("enable_lsd");
    peer.download_rate_limit = settings_->get<int>("download_rate_limit");
    peer.upload_rate_limit = settings_->get<int>("upload_rate_limit");
    peer.seed_after_download = settings_->get<bool>("seed_after_download");
    peer_backend_ = std::make_unique<PeerBackend>(io, peer, logger_->child("peer"));
  }

  auto history_path = resolve_path(settings_->get<std::string>("history_path"));
  if(history_path.empty()) {
    history_path = settings_->config_dir() / "history.jsonl";
  }
  history_ = std::make_shared<JsonlHistorySink>(history_path, logger_->child("history"));

  DownloadCoordinator::Options coordination;
  coordination.sample_interval = settings_->get_ms("sample_interval_ms");
  coordination.completed_grace = settings_->get_ms("completed_grace_ms");
  coordination.default_destination = download_dir().string();
  coordinator_ = std::make_unique<DownloadCoordinator>(io,
                                                       coordination,
                                                       http_backend_.get(),
                                                       peer_backend_.get(),
                                                       history_,
                                                       logger_->child("coordinator"));
  publisher_ = std::make_unique<ProgressPublisher>(io, *coordinator_, coordination.sample_interval, logger_->child("progress"));

  CommandSurface::Options surface;
  surface.default_cleanup = cleanup_policy_from_string(settings_->get<std::string>("cleanup_policy"))
                              .value_or(CleanupPolicy::Persist);
  surface.history = history_;
  surface.status = [this](){
    nlohmann::json status = {
      {"daemon", to_string(supervisor_->state())},
      {"daemon_owned", supervisor_->owns_process()},
      {"respawns", supervisor_->respawn_count()},
      {"rpc_port", supervisor_->options().endpoint.port},
      {"peer_backend", static_cast<bool>(peer_backend_)},
      {"ticks", publisher_->tick_count()},
      {"downloads", coordinator_->list().size()}
    };
    return status;
  };
  commands_ = std::make_unique<CommandSurface>(*coordinator_, std::move(surface), logger_->child("commands"));

  work_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(io.get_executor());
  io_thread_ = std::thread([&io](){
    io.run();
  });
  started_ = true;

  auto budget = daemon.startup_timeout + 2 * daemon.rpc_timeout + std::chrono::seconds(1);
  auto status = wait_for([this](std::function<void(const OpStatus&)> done){
    supervisor_->initialize(std::move(done));
  }, std::chrono::duration_cast<std::chrono::milliseconds>(budget), "daemon startup");
  if(!status.ok()) {
    logger_->error("Unable to start the download daemon: {}", status.message);
    stop();
    throw StartupError(status.message);
  }

  publisher_->start();
  logger_->info("engine ready, downloads go to {}", download_dir().string());
}

void DownloadEngine::stop() {
  if(!started_) return;
  started_ = false;

  if(publisher_) publisher_->stop();
  if(coordinator_ && http_backend_) {
    // The daemon takes its task list down with it.
    coordinator_->drop_records(http_backend_.get());
  }
  if(supervisor_) {
    auto budget = supervisor_->options().shutdown_timeout + supervisor_->options().rpc_timeout + std::chrono::seconds(1);
    auto status = wait_for([this](std::function<void(const OpStatus&)> done){
      supervisor_->shutdown(std::move(done));
    }, std::chrono::duration_cast<std::chrono::milliseconds>(budget), "daemon shutdown");
    if(!status.ok()) {
      logger_->warn("daemon shutdown: {}", status.message);
    }
  }

  work_.reset();
  if(io_) io_->stop();
  if(io_thread_.joinable()) {
    io_thread_.join();
  }

  commands_.reset();
  publisher_.reset();
  coordinator_.reset();
  peer_backend_.reset();
  http_backend_.reset();
  supervisor_.reset();
  io_.reset();
}

std::string DownloadEngine::execute_command(const std::string& line) {
  if(!commands_) {
    return nlohmann::json{{"ok", false}, {"error", "StartupError: engine not started"}}.dump();
  }
  return commands_->execute(line);
}

DownloadCoordinator& DownloadEngine::coordinator() {
  if(!coordinator_) throw std::logic_error("engine not started");
  return *coordinator_;
}

ProgressPublisher& DownloadEngine::publisher() {
  if(!publisher_) throw std::logic_error("engine not started");
  return *publisher_;
}

DaemonSupervisor& DownloadEngine::supervisor() {
  if(!supervisor_) throw std::logic_error("engine not started");
  return *supervisor_;
}

LogListenerHandle DownloadEngine::add_log_listener(Logger::Listener listener, void* user_data) {
  if(!logger_) return 0;
  return logger_->add_listener(std::move(listener), user_data);
}

void DownloadEngine::remove_log_listener(LogListenerHandle handle) {
  if(logger_ && handle != 0) {
    logger_->remove_listener(handle);
  }
}
