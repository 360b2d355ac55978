#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

// Sets up the shared sinks. Diagnostics go to stderr so stdout carries only
// command replies and events; with log_file set every stamped line is also
// appended there.
void init(bool verbose = false, const std::string& log_file = std::string());
void set_log_passthrough(bool enabled);
bool log_passthrough();

using LogListenerHandle = std::size_t;

enum class LogStream {
  Diagnostic, // stamped, stderr (+ log file)
  Reply,      // bare line on stdout
  Console     // bare line on stderr
};

// A named channel ("haul:daemon"). Children share their parent's listeners,
// so a listener on the engine logger hears every component.
class Logger {
public:
  using Listener = std::function<bool(void* user_data,
                                      const std::string& channel,
                                      spdlog::level::level_enum level,
                                      const std::string& message)>;

  explicit Logger(std::string name);

  std::shared_ptr<Logger> child(const std::string& component) const;
  const std::string& name() const { return name_; }

  LogListenerHandle add_listener(Listener listener, void* user_data = nullptr);
  void remove_listener(LogListenerHandle handle);

  template<typename... Args>
  void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(LogStream::Diagnostic, spdlog::level::info, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(LogStream::Diagnostic, spdlog::level::warn, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(LogStream::Diagnostic, spdlog::level::err, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(LogStream::Diagnostic, spdlog::level::debug, fmt, std::forward<Args>(args)...);
  }

  // One line of front-end output: a command reply or an event.
  template<typename... Args>
  void reply(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(LogStream::Reply, spdlog::level::info, fmt, std::forward<Args>(args)...);
  }

private:
  struct ListenerBinding {
    void* user_data = nullptr;
    Listener callback;
  };

  struct ListenerTable {
    std::mutex mutex;
    std::unordered_map<LogListenerHandle, ListenerBinding> bindings;
    std::atomic<LogListenerHandle> next_id{1};
  };

  Logger(std::string name, std::shared_ptr<ListenerTable> listeners);

  template<typename... Args>
  void log(LogStream stream,
           spdlog::level::level_enum level,
           spdlog::format_string_t<Args...> fmt,
           Args&&... args) {
    if(stream == LogStream::Diagnostic && !spdlog::should_log(level) && !has_listeners()) return;
    write(stream, level, fmt::format(fmt, std::forward<Args>(args)...));
  }

  bool has_listeners() const;
  void write(LogStream stream, spdlog::level::level_enum level, const std::string& message);

  std::string name_;
  std::shared_ptr<ListenerTable> listeners_;
};

namespace detail {
void emit(LogStream stream,
          spdlog::level::level_enum level,
          const std::string& channel,
          const std::string& message);
} // namespace detail

// Helpers for code that may run without a logger (nullptr goes straight to
// the shared sinks).
template<typename... Args>
inline void log_warn(Logger* logger,
                     spdlog::format_string_t<Args...> fmt,
                     Args&&... args) {
  if(logger) {
    logger->warn(fmt, std::forward<Args>(args)...);
  } else {
    detail::emit(LogStream::Diagnostic, spdlog::level::warn, std::string(),
                 fmt::format(fmt, std::forward<Args>(args)...));
  }
}

template<typename... Args>
inline void log_debug(Logger* logger,
                      spdlog::format_string_t<Args...> fmt,
                      Args&&... args) {
  if(logger) {
    logger->debug(fmt, std::forward<Args>(args)...);
  } else {
    detail::emit(LogStream::Diagnostic, spdlog::level::debug, std::string(),
                 fmt::format(fmt, std::forward<Args>(args)...));
  }
}

// Usage text and start-up complaints, printed before any engine exists.
template<typename... Args>
inline void console_out(spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::emit(LogStream::Reply, spdlog::level::info, std::string(),
               fmt::format(fmt, std::forward<Args>(args)...));
}

template<typename... Args>
inline void console_err(spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::emit(LogStream::Console, spdlog::level::err, std::string(),
               fmt::format(fmt, std::forward<Args>(args)...));
}
