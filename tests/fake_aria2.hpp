#pragma once

#include <asio.hpp>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "daemon_process.hpp"
#include "errors.hpp"

namespace haul::test {

// Bytes a fake daemon left on disk, shared across restarts so that
// --continue behaves like the real thing.
struct FakeDisk {
  std::mutex mutex;
  std::map<std::string, uint64_t> bytes;
};

inline uint16_t pick_free_port() {
  asio::io_context io;
  asio::ip::tcp::acceptor acceptor(io, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
  return acceptor.local_endpoint().port();
}

// Minimal aria2 JSON-RPC endpoint. Active tasks advance a fixed number of
// bytes every step; URLs containing "fail" error out, "nosize" never learn
// their length.
class FakeAria2 {
public:
  struct Options {
    uint16_t port = 0;
    std::string secret;
    uint64_t default_total = 4 * 1024 * 1024;
    uint64_t bytes_per_step = 64 * 1024;
    std::chrono::milliseconds step{50};
    bool incompatible = false; // answer plain HTML
    bool silent = false;       // accept, never answer
    std::shared_ptr<FakeDisk> disk;
  };

  explicit FakeAria2(Options options)
    : options_(std::move(options)),
      acceptor_(io_),
      step_timer_(io_) {
    if(!options_.disk) options_.disk = std::make_shared<FakeDisk>();
  }

  ~FakeAria2() {
    stop();
  }

  void start() {
    using asio::ip::tcp;
    tcp::endpoint endpoint(asio::ip::make_address("127.0.0.1"), options_.port);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();
    port_ = acceptor_.local_endpoint().port();
    running_ = true;
    accept();
    schedule_step();
    thread_ = std::thread([this](){ io_.run(); });
  }

  // Refuses new connections from here on; a stopped server is not restarted.
  void stop() {
    if(thread_.joinable()) {
      io_.stop();
      thread_.join();
    }
    close_listener();
  }

  bool running() const { return running_; }
  uint16_t port() const { return port_; }

  std::size_t calls(const std::string& method) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = calls_.find(method);
    return it == calls_.end() ? 0 : it->second;
  }

  std::size_t task_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
  }

  std::string task_status(const std::string& gid) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(gid);
    return it == tasks_.end() ? std::string() : it->second.status;
  }

  void set_task_status(const std::string& gid, const std::string& status) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(gid);
    if(it != tasks_.end()) it->second.status = status;
  }

  // Next getVersion-free calls never get an answer.
  void set_silent(bool silent) { options_.silent = silent; }

private:
  struct Task {
    std::string gid;
    std::string url;
    std::string dir;
    std::string path;
    std::string status = "active";
    uint64_t total = 0;
    uint64_t completed = 0;
    std::string error_message;
  };

  struct Fault {
    int code;
    std::string message;
  };

  class Session : public std::enable_shared_from_this<Session> {
  public:
    Session(FakeAria2& owner, asio::ip::tcp::socket socket)
      : owner_(owner), socket_(std::move(socket)) {}

    void start() {
      auto self = shared_from_this();
      asio::async_read_until(socket_, buffer_, "\r\n\r\n",
        [this, self](std::error_code ec, std::size_t header_bytes){
          if(ec) return;
          std::string headers(asio::buffers_begin(buffer_.data()),
                              asio::buffers_begin(buffer_.data()) + static_cast<std::ptrdiff_t>(header_bytes));
          buffer_.consume(header_bytes);
          std::size_t length = content_length(headers);
          if(buffer_.size() >= length) return respond();
          asio::async_read(socket_, buffer_, asio::transfer_exactly(length - buffer_.size()),
            [this, self](std::error_code ec, std::size_t){
              if(ec) return;
              respond();
            });
        });
    }

  private:
    static std::size_t content_length(const std::string& headers) {
      std::istringstream lines(headers);
      std::string line;
      while(std::getline(lines, line)) {
        if(line.size() > 15 && (line.compare(0, 15, "Content-Length:") == 0 ||
                                line.compare(0, 15, "content-length:") == 0)) {
          return static_cast<std::size_t>(std::stoul(line.substr(15)));
        }
      }
      return 0;
    }

    void respond() {
      if(owner_.options_.silent) {
        owner_.park(shared_from_this());
        return;
      }
      std::string body(asio::buffers_begin(buffer_.data()), asio::buffers_end(buffer_.data()));
      std::string content_type = "application/json";
      std::string payload;
      if(owner_.options_.incompatible) {
        content_type = "text/html";
        payload = "<html><body>not aria2</body></html>";
      } else {
        payload = owner_.handle(body).dump();
      }
      std::ostringstream out;
      out << "HTTP/1.1 200 OK\r\n"
          << "Content-Type: " << content_type << "\r\n"
          << "Content-Length: " << payload.size() << "\r\n"
          << "Connection: close\r\n\r\n"
          << payload;
      response_ = out.str();
      auto self = shared_from_this();
      asio::async_write(socket_, asio::buffer(response_), [this, self](std::error_code, std::size_t){
        std::error_code ignored;
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
        socket_.close(ignored);
        owner_.after_response();
      });
    }

    FakeAria2& owner_;
    asio::ip::tcp::socket socket_;
    asio::streambuf buffer_;
    std::string response_;
  };

  void accept() {
    acceptor_.async_accept([this](std::error_code ec, asio::ip::tcp::socket socket){
      if(ec) return;
      std::make_shared<Session>(*this, std::move(socket))->start();
      if(running_) accept();
    });
  }

  void park(std::shared_ptr<Session> session) {
    parked_.push_back(std::move(session));
  }

  void close_listener() {
    std::error_code ignored;
    acceptor_.close(ignored);
    step_timer_.cancel(ignored);
    parked_.clear();
    running_ = false;
  }

  void after_response() {
    if(shutdown_requested_) {
      close_listener();
    }
  }

  void schedule_step() {
    step_timer_.expires_after(options_.step);
    step_timer_.async_wait([this](const std::error_code& ec){
      if(ec || !running_) return;
      advance();
      schedule_step();
    });
  }

  void advance() {
    std::lock_guard<std::mutex> lock(mutex_);
    for(auto& [gid, task] : tasks_) {
      if(task.status != "active") continue;
      if(task.url.find("fail") != std::string::npos) {
        task.status = "error";
        task.error_message = "Resource not found";
        continue;
      }
      task.completed += options_.bytes_per_step;
      if(task.total > 0 && task.completed >= task.total) {
        task.completed = task.total;
        task.status = "complete";
        std::error_code ec;
        std::filesystem::remove(task.path + ".aria2", ec);
      }
      std::lock_guard<std::mutex> disk_lock(options_.disk->mutex);
      options_.disk->bytes[task.path] = task.completed;
    }
  }

  uint64_t speed() const {
    return options_.bytes_per_step * 1000 / static_cast<uint64_t>(std::max<int64_t>(1, options_.step.count()));
  }

  nlohmann::json describe(const Task& task) const {
    bool moving = task.status == "active";
    return nlohmann::json{
      {"gid", task.gid},
      {"status", task.status},
      {"totalLength", std::to_string(task.total)},
      {"completedLength", std::to_string(task.completed)},
      {"downloadSpeed", std::to_string(moving ? speed() : 0)},
      {"uploadSpeed", "0"},
      {"dir", task.dir},
      {"errorCode", task.error_message.empty() ? "0" : "3"},
      {"errorMessage", task.error_message},
      {"files", nlohmann::json::array({
        {{"index", "1"},
         {"path", task.path},
         {"length", std::to_string(task.total)},
         {"completedLength", std::to_string(task.completed)},
         {"uris", nlohmann::json::array({{{"uri", task.url}, {"status", "used"}}})}}
      })}
    };
  }

  Task& find_task(const nlohmann::json& params, std::size_t index) {
    if(params.size() <= index || !params[index].is_string()) {
      throw Fault{1, "gid expected"};
    }
    auto gid = params[index].get<std::string>();
    auto it = tasks_.find(gid);
    if(it == tasks_.end()) throw Fault{1, "GID " + gid + " is not found"};
    return it->second;
  }

  nlohmann::json add_uri(const nlohmann::json& params) {
    if(params.empty() || !params[0].is_array() || params[0].empty()) {
      throw Fault{1, "No URI to download."};
    }
    Task task;
    char buffer[17];
    std::snprintf(buffer, sizeof(buffer), "%016llx", static_cast<unsigned long long>(0x2089b05ecca3d800ULL + ++next_gid_));
    task.gid = buffer;
    task.url = params[0][0].get<std::string>();
    auto options = params.size() > 1 ? params[1] : nlohmann::json::object();
    task.dir = options.value("dir", std::string("."));
    std::string name = options.value("out", std::string());
    if(name.empty()) {
      auto slash = task.url.find_last_of('/');
      name = slash == std::string::npos ? task.url : task.url.substr(slash + 1);
      if(name.empty()) name = "index.html";
    }
    task.path = (std::filesystem::path(task.dir) / name).string();
    task.total = task.url.find("nosize") != std::string::npos ? 0 : options_.default_total;
    {
      std::lock_guard<std::mutex> disk_lock(options_.disk->mutex);
      auto it = options_.disk->bytes.find(task.path);
      if(it != options_.disk->bytes.end() && options.value("continue", std::string()) == "true") {
        task.completed = it->second;
      }
    }
    std::error_code ec;
    std::filesystem::create_directories(task.dir, ec);
    std::ofstream(task.path, std::ios::app).put('\0');
    std::ofstream(task.path + ".aria2", std::ios::app).put('\0');
    tasks_[task.gid] = task;
    return task.gid;
  }

  nlohmann::json list(const std::vector<std::string>& statuses) const {
    auto result = nlohmann::json::array();
    for(const auto& [gid, task] : tasks_) {
      for(const auto& status : statuses) {
        if(task.status == status) {
          result.push_back(describe(task));
          break;
        }
      }
    }
    return result;
  }

  nlohmann::json call(const std::string& method, nlohmann::json params) {
    if(method == "aria2.getVersion") {
      return {{"version", "1.37.0"}, {"enabledFeatures", {"Async DNS", "HTTPS"}}};
    }
    if(method == "aria2.addUri") return add_uri(params);
    if(method == "aria2.tellStatus") return describe(find_task(params, 0));
    if(method == "aria2.pause") {
      auto& task = find_task(params, 0);
      if(task.status != "active" && task.status != "waiting") {
        throw Fault{1, "GID#" + task.gid + " cannot be paused now"};
      }
      task.status = "paused";
      return task.gid;
    }
    if(method == "aria2.unpause") {
      auto& task = find_task(params, 0);
      if(task.status != "paused") {
        throw Fault{1, "GID#" + task.gid + " cannot be unpaused now"};
      }
      task.status = "active";
      return task.gid;
    }
    if(method == "aria2.remove") {
      auto& task = find_task(params, 0);
      if(task.status != "active" && task.status != "waiting" && task.status != "paused") {
        throw Fault{1, "GID#" + task.gid + " cannot be removed now"};
      }
      task.status = "removed";
      return task.gid;
    }
    if(method == "aria2.removeDownloadResult") {
      auto& task = find_task(params, 0);
      if(task.status != "complete" && task.status != "error" && task.status != "removed") {
        throw Fault{1, "Could not remove download result of GID#" + task.gid};
      }
      tasks_.erase(task.gid);
      return "OK";
    }
    if(method == "aria2.tellActive") return list({"active"});
    if(method == "aria2.tellWaiting") return list({"waiting", "paused"});
    if(method == "aria2.tellStopped") return list({"complete", "error", "removed"});
    if(method == "aria2.shutdown") {
      shutdown_requested_ = true;
      return "OK";
    }
    throw Fault{1, "No such method: " + method};
  }

  nlohmann::json handle(const std::string& body) {
    auto request = nlohmann::json::parse(body, nullptr, false);
    nlohmann::json reply = {{"jsonrpc", "2.0"}};
    if(request.is_discarded()) {
      reply["id"] = nullptr;
      reply["error"] = {{"code", -32700}, {"message", "Parse error."}};
      return reply;
    }
    reply["id"] = request.value("id", nlohmann::json());
    auto method = request.value("method", std::string());
    auto params = request.value("params", nlohmann::json::array());

    std::lock_guard<std::mutex> lock(mutex_);
    calls_[method]++;
    try {
      if(!options_.secret.empty()) {
        if(params.empty() || params[0] != "token:" + options_.secret) {
          throw Fault{1, "Unauthorized"};
        }
        params.erase(params.begin());
      }
      reply["result"] = call(method, std::move(params));
    } catch(const Fault& fault) {
      reply["error"] = {{"code", fault.code}, {"message", fault.message}};
    }
    return reply;
  }

  Options options_;
  asio::io_context io_;
  asio::ip::tcp::acceptor acceptor_;
  asio::steady_timer step_timer_;
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<bool> shutdown_requested_{false};
  uint16_t port_ = 0;
  mutable std::mutex mutex_;
  std::map<std::string, Task> tasks_;
  std::map<std::string, std::size_t> calls_;
  std::vector<std::shared_ptr<Session>> parked_;
  uint64_t next_gid_ = 0;
};

// Starts a FakeAria2 on the port named in the spawn arguments instead of a
// process. Killing it drops every task, like a real crash would.
class FakeDaemonLauncher : public DaemonLauncher {
public:
  struct Shared {
    std::atomic<int> launches{0};
    std::atomic<bool> refuse_launch{false};
    std::shared_ptr<FakeDisk> disk = std::make_shared<FakeDisk>();
    std::mutex mutex;
    FakeAria2* current = nullptr;
    std::vector<std::string> last_args;
    FakeAria2::Options server_options;
  };

  explicit FakeDaemonLauncher(std::shared_ptr<Shared> shared)
    : shared_(std::move(shared)) {}

  ~FakeDaemonLauncher() override {
    kill();
  }

  void launch(const std::filesystem::path&, const std::vector<std::string>& args) override {
    shared_->launches++;
    if(shared_->refuse_launch) {
      throw StartupError("fake launcher refused to start");
    }
    FakeAria2::Options options = shared_->server_options;
    options.disk = shared_->disk;
    for(const auto& arg : args) {
      const std::string prefix = "--rpc-listen-port=";
      if(arg.compare(0, prefix.size(), prefix) == 0) {
        options.port = static_cast<uint16_t>(std::stoi(arg.substr(prefix.size())));
      }
      const std::string secret = "--rpc-secret=";
      if(arg.compare(0, secret.size(), secret) == 0) {
        options.secret = arg.substr(secret.size());
      }
    }
    server_ = std::make_unique<FakeAria2>(options);
    server_->start();
    std::lock_guard<std::mutex> lock(shared_->mutex);
    shared_->current = server_.get();
    shared_->last_args = args;
  }

  bool running() override {
    return server_ && server_->running();
  }

  void terminate() override {
    kill();
  }

  void kill() override {
    if(!server_) return;
    {
      std::lock_guard<std::mutex> lock(shared_->mutex);
      if(shared_->current == server_.get()) shared_->current = nullptr;
    }
    server_->stop();
    server_.reset();
  }

private:
  std::shared_ptr<Shared> shared_;
  std::unique_ptr<FakeAria2> server_;
};

// Simulates the daemon dying underneath the supervisor.
inline void crash_current_daemon(const std::shared_ptr<FakeDaemonLauncher::Shared>& shared) {
  std::lock_guard<std::mutex> lock(shared->mutex);
  if(shared->current) shared->current->stop();
}

inline std::filesystem::path make_fake_binary(const std::filesystem::path& dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  auto path = dir / "aria2c";
  {
    std::ofstream out(path, std::ios::trunc);
    out << "#!/bin/sh\nexit 0\n";
  }
  std::filesystem::permissions(path,
                               std::filesystem::perms::owner_all |
                               std::filesystem::perms::group_read | std::filesystem::perms::group_exec,
                               std::filesystem::perm_options::replace, ec);
  return path;
}

} // namespace haul::test
