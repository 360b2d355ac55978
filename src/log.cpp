#include "log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <vector>

namespace {
constexpr const char* kStampedPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

struct Sinks {
  std::shared_ptr<spdlog::logger> diagnostic;
  std::shared_ptr<spdlog::logger> reply;
  std::shared_ptr<spdlog::logger> console;
  std::shared_ptr<spdlog::sinks::basic_file_sink_mt> file;
};

Sinks g_sinks;
std::mutex g_setup_mutex;
std::atomic<bool> g_log_passthrough{true};

void create_sinks_locked() {
  if(g_sinks.diagnostic) return;

  auto stamped = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  stamped->set_pattern(kStampedPattern);
  auto bare_out = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  bare_out->set_pattern("%v");
  auto bare_err = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  bare_err->set_pattern("%v");

  g_sinks.diagnostic = std::make_shared<spdlog::logger>("haul", std::move(stamped));
  g_sinks.reply = std::make_shared<spdlog::logger>("haul.reply", std::move(bare_out));
  g_sinks.console = std::make_shared<spdlog::logger>("haul.console", std::move(bare_err));

  g_sinks.diagnostic->flush_on(spdlog::level::warn);
  // Replies are read line by line by whoever drives stdin.
  g_sinks.reply->flush_on(spdlog::level::trace);
  g_sinks.console->flush_on(spdlog::level::trace);
}

const Sinks& sinks() {
  std::lock_guard<std::mutex> lock(g_setup_mutex);
  create_sinks_locked();
  return g_sinks;
}

void attach_file_sink_locked(const std::string& log_file) {
  if(log_file.empty() || g_sinks.file) return;
  try {
    g_sinks.file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
  } catch(const spdlog::spdlog_ex& e) {
    g_sinks.console->error("Unable to open log file {}: {}", log_file, e.what());
    return;
  }
  g_sinks.file->set_pattern(kStampedPattern);
  g_sinks.diagnostic->sinks().push_back(g_sinks.file);
}

} // namespace

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

void init(bool verbose, const std::string& log_file) {
  std::lock_guard<std::mutex> lock(g_setup_mutex);
  create_sinks_locked();
  attach_file_sink_locked(log_file);

  auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  g_sinks.diagnostic->set_level(level);
  spdlog::set_default_logger(g_sinks.diagnostic);
  spdlog::set_level(level);
}

Logger::Logger(std::string name)
  : name_(std::move(name)),
    listeners_(std::make_shared<ListenerTable>()) {}

Logger::Logger(std::string name, std::shared_ptr<ListenerTable> listeners)
  : name_(std::move(name)),
    listeners_(std::move(listeners)) {}

std::shared_ptr<Logger> Logger::child(const std::string& component) const {
  return std::shared_ptr<Logger>(new Logger(name_ + ":" + component, listeners_));
}

LogListenerHandle Logger::add_listener(Listener listener, void* user_data) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(listeners_->mutex);
  const auto id = listeners_->next_id++;
  listeners_->bindings.emplace(id, ListenerBinding{user_data, std::move(listener)});
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(listeners_->mutex);
  listeners_->bindings.erase(handle);
}

bool Logger::has_listeners() const {
  std::lock_guard<std::mutex> lock(listeners_->mutex);
  return !listeners_->bindings.empty();
}

void Logger::write(LogStream stream, spdlog::level::level_enum level, const std::string& message) {
  std::vector<ListenerBinding> snapshot;
  {
    std::lock_guard<std::mutex> lock(listeners_->mutex);
    snapshot.reserve(listeners_->bindings.size());
    for(const auto& entry : listeners_->bindings) {
      snapshot.push_back(entry.second);
    }
  }
  bool handled = false;
  for(auto& binding : snapshot) {
    try {
      if(binding.callback && binding.callback(binding.user_data, name_, level, message)) {
        handled = true;
      }
    } catch(const std::exception& e) {
      detail::emit(LogStream::Console, spdlog::level::err, name_,
                   fmt::format("log listener threw: {}", e.what()));
    }
  }
  if(!handled) {
    detail::emit(stream, level, name_, message);
  }
}

namespace detail {

void emit(LogStream stream,
          spdlog::level::level_enum level,
          const std::string& channel,
          const std::string& message) {
  const auto& s = sinks();
  if(!log_passthrough()) return;

  switch(stream) {
    case LogStream::Reply:
      s.reply->log(level, message);
      return;
    case LogStream::Console:
      s.console->log(level, message);
      return;
    case LogStream::Diagnostic:
      break;
  }
  if(channel.empty()) {
    s.diagnostic->log(level, message);
  } else {
    s.diagnostic->log(level, fmt::format("[{}] {}", channel, message));
  }
}

} // namespace detail
