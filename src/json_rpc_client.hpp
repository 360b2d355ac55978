#pragma once

#include <asio.hpp>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "log.hpp"

struct RpcReply {
  bool success = false;
  bool timed_out = false;
  bool transport_error = false; // refused, reset or closed before a reply
  bool protocol_error = false;  // something answered, but not JSON-RPC
  nlohmann::json result;
  int error_code = 0;
  std::string error;

  // Nothing trustworthy answered: the daemon is gone or hung.
  bool daemon_unreachable() const { return timed_out || transport_error; }
};

// JSON-RPC 2.0 over HTTP POST, one connection per call.
class JsonRpcClient {
public:
  struct Endpoint {
    std::string host = "127.0.0.1";
    uint16_t port = 6800;
    std::string secret;
    std::string path = "/jsonrpc";
  };

  using ReplyHandler = std::function<void(const RpcReply&)>;

  JsonRpcClient(asio::io_context& io,
                Endpoint endpoint,
                std::chrono::milliseconds timeout,
                std::shared_ptr<Logger> logger = nullptr);

  // A call that times out is retried once before the timeout is reported.
  void call(const std::string& method, nlohmann::json params, ReplyHandler handler);
  void call_once(const std::string& method, nlohmann::json params, ReplyHandler handler);

  const Endpoint& endpoint() const { return endpoint_; }
  std::chrono::milliseconds timeout() const { return timeout_; }

private:
  std::string build_request(const std::string& method, const nlohmann::json& params);
  void attempt(const std::string& method,
               std::shared_ptr<const nlohmann::json> params,
               int attempt_number,
               ReplyHandler handler);

  asio::io_context& io_;
  Endpoint endpoint_;
  std::chrono::milliseconds timeout_;
  std::shared_ptr<Logger> logger_;
  std::atomic<uint64_t> request_counter_{0};
};
