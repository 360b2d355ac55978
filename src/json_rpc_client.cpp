#include "json_rpc_client.hpp"

#include <algorithm>
#include <cctype>
#include <istream>
#include <optional>
#include <sstream>

using json = nlohmann::json;
using asio::ip::tcp;

namespace {

// One HTTP request/response on its own socket, bounded by a deadline timer.
class RpcExchange : public std::enable_shared_from_this<RpcExchange> {
public:
  RpcExchange(asio::io_context& io,
              std::string host,
              uint16_t port,
              std::string request,
              std::chrono::milliseconds timeout,
              JsonRpcClient::ReplyHandler handler)
    : resolver_(io),
      socket_(io),
      timer_(io),
      host_(std::move(host)),
      port_(port),
      request_(std::move(request)),
      timeout_(timeout),
      handler_(std::move(handler)) {}

  void start() {
    auto self = shared_from_this();
    timer_.expires_after(timeout_);
    timer_.async_wait([this, self](const std::error_code& ec){
      if(ec || done_) return;
      timed_out_ = true;
      std::error_code ignored;
      resolver_.cancel();
      socket_.close(ignored);
    });

    resolver_.async_resolve(host_, std::to_string(port_),
      [this, self](std::error_code ec, tcp::resolver::results_type results){
        if(ec) return fail(ec, "resolve");
        asio::async_connect(socket_, results,
          [this, self](std::error_code ec, const tcp::endpoint&){
            if(ec) return fail(ec, "connect");
            asio::async_write(socket_, asio::buffer(request_),
              [this, self](std::error_code ec, std::size_t){
                if(ec) return fail(ec, "write");
                read_headers();
              });
          });
      });
  }

private:
  void read_headers() {
    auto self = shared_from_this();
    asio::async_read_until(socket_, buffer_, "\r\n\r\n",
      [this, self](std::error_code ec, std::size_t header_bytes){
        if(ec) return fail(ec, "read");
        std::string headers(asio::buffers_begin(buffer_.data()),
                            asio::buffers_begin(buffer_.data()) + static_cast<std::ptrdiff_t>(header_bytes));
        buffer_.consume(header_bytes);

        if(headers.rfind("HTTP/", 0) != 0) {
          return finish_protocol_error("endpoint did not answer with HTTP");
        }
        auto content_length = parse_content_length(headers);
        if(content_length) {
          if(buffer_.size() >= *content_length) {
            return finish_body();
          }
          asio::async_read(socket_, buffer_, asio::transfer_exactly(*content_length - buffer_.size()),
            [this, self](std::error_code ec, std::size_t){
              if(ec) return fail(ec, "read body");
              finish_body();
            });
          return;
        }
        asio::async_read(socket_, buffer_, asio::transfer_all(),
          [this, self](std::error_code ec, std::size_t){
            if(ec && ec != asio::error::eof) return fail(ec, "read body");
            finish_body();
          });
      });
  }

  static std::optional<std::size_t> parse_content_length(const std::string& headers) {
    std::istringstream lines(headers);
    std::string line;
    while(std::getline(lines, line)) {
      auto colon = line.find(':');
      if(colon == std::string::npos) continue;
      std::string name = line.substr(0, colon);
      std::transform(name.begin(), name.end(), name.begin(),
                     [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
      if(name != "content-length") continue;
      try {
        return static_cast<std::size_t>(std::stoul(line.substr(colon + 1)));
      } catch(const std::exception&) {
        return std::nullopt;
      }
    }
    return std::nullopt;
  }

  void finish_body() {
    std::string body(asio::buffers_begin(buffer_.data()), asio::buffers_end(buffer_.data()));
    auto doc = json::parse(body, nullptr, false);
    if(doc.is_discarded() || !doc.is_object() || !doc.contains("jsonrpc")) {
      return finish_protocol_error("reply is not JSON-RPC");
    }
    RpcReply reply;
    if(doc.contains("error") && doc["error"].is_object()) {
      reply.error_code = doc["error"].value("code", 0);
      reply.error = doc["error"].value("message", std::string("unknown RPC error"));
    } else if(doc.contains("result")) {
      reply.success = true;
      reply.result = doc["result"];
    } else {
      return finish_protocol_error("reply has neither result nor error");
    }
    finish(std::move(reply));
  }

  void finish_protocol_error(const std::string& message) {
    RpcReply reply;
    reply.protocol_error = true;
    reply.error = message;
    finish(std::move(reply));
  }

  void fail(const std::error_code& ec, const char* stage) {
    RpcReply reply;
    if(timed_out_) {
      reply.timed_out = true;
      reply.error = "timed out after " + std::to_string(timeout_.count()) + "ms";
    } else {
      reply.transport_error = true;
      reply.error = std::string(stage) + ": " + ec.message();
    }
    finish(std::move(reply));
  }

  void finish(RpcReply reply) {
    if(done_) return;
    done_ = true;
    timer_.cancel();
    std::error_code ignored;
    socket_.shutdown(tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);
    if(handler_) handler_(reply);
  }

  tcp::resolver resolver_;
  tcp::socket socket_;
  asio::steady_timer timer_;
  asio::streambuf buffer_;
  std::string host_;
  uint16_t port_;
  std::string request_;
  std::chrono::milliseconds timeout_;
  JsonRpcClient::ReplyHandler handler_;
  bool done_ = false;
  bool timed_out_ = false;
};

} // namespace

JsonRpcClient::JsonRpcClient(asio::io_context& io,
                             Endpoint endpoint,
                             std::chrono::milliseconds timeout,
                             std::shared_ptr<Logger> logger)
  : io_(io),
    endpoint_(std::move(endpoint)),
    timeout_(timeout),
    logger_(std::move(logger)) {}

std::string JsonRpcClient::build_request(const std::string& method, const json& params) {
  json args = json::array();
  if(!endpoint_.secret.empty()) {
    args.push_back("token:" + endpoint_.secret);
  }
  for(const auto& p : params) {
    args.push_back(p);
  }
  json body = {
    {"jsonrpc", "2.0"},
    {"id", "haul-" + std::to_string(++request_counter_)},
    {"method", method},
    {"params", std::move(args)}
  };
  std::string payload = body.dump();

  std::ostringstream out;
  out << "POST " << endpoint_.path << " HTTP/1.1\r\n"
      << "Host: " << endpoint_.host << ":" << endpoint_.port << "\r\n"
      << "Content-Type: application/json\r\n"
      << "Accept: application/json\r\n"
      << "Content-Length: " << payload.size() << "\r\n"
      << "Connection: close\r\n\r\n"
      << payload;
  return out.str();
}

void JsonRpcClient::call(const std::string& method, json params, ReplyHandler handler) {
  attempt(method, std::make_shared<const json>(std::move(params)), 1, std::move(handler));
}

void JsonRpcClient::call_once(const std::string& method, json params, ReplyHandler handler) {
  auto exchange = std::make_shared<RpcExchange>(io_,
                                                endpoint_.host,
                                                endpoint_.port,
                                                build_request(method, params),
                                                timeout_,
                                                std::move(handler));
  exchange->start();
}

void JsonRpcClient::attempt(const std::string& method,
                            std::shared_ptr<const json> params,
                            int attempt_number,
                            ReplyHandler handler) {
  auto exchange = std::make_shared<RpcExchange>(io_,
    endpoint_.host,
    endpoint_.port,
    build_request(method, *params),
    timeout_,
    [this, method, params, attempt_number, handler](const RpcReply& reply){
      if(reply.timed_out && attempt_number == 1) {
        log_warn(logger_.get(), "RPC {} timed out, retrying once", method);
        attempt(method, params, 2, handler);
        return;
      }
      if(!reply.success) {
        log_debug(logger_.get(), "RPC {} failed: {}", method, reply.error);
      }
      if(handler) handler(reply);
    });
  exchange->start();
}
