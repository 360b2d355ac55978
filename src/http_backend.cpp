#include "http_backend.hpp"

#include <array>
#include <filesystem>
#include <utility>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

const json& task_keys() {
  static const json keys = json::array({"gid", "status", "dir", "files"});
  return keys;
}

const json& status_keys() {
  static const json keys = json::array({
    "gid", "status", "totalLength", "completedLength", "downloadSpeed",
    "uploadSpeed", "errorCode", "errorMessage", "dir", "files"
  });
  return keys;
}

// aria2 sends every number as a decimal string.
uint64_t parse_u64(const json& value) {
  if(value.is_number_unsigned()) return value.get<uint64_t>();
  if(value.is_number_integer()) {
    auto v = value.get<int64_t>();
    return v < 0 ? 0 : static_cast<uint64_t>(v);
  }
  if(!value.is_string()) return 0;
  try {
    return std::stoull(value.get<std::string>());
  } catch(const std::exception&) {
    return 0;
  }
}

std::string first_file_path(const json& task) {
  if(!task.contains("files") || !task["files"].is_array() || task["files"].empty()) {
    return std::string();
  }
  return task["files"][0].value("path", std::string());
}

bool same_directory(const std::string& a, const std::string& b) {
  auto normalize = [](const std::string& value){
    auto p = fs::path(value).lexically_normal();
    auto text = p.string();
    while(text.size() > 1 && text.back() == '/') text.pop_back();
    return text;
  };
  return normalize(a) == normalize(b);
}

// Status strings of a task that is still transferring.
bool unfinished_status(const std::string& status) {
  return status == "active" || status == "waiting" || status == "paused";
}

// A known task may also be one that already finished.
bool reusable_status(const std::string& status) {
  return unfinished_status(status) || status == "complete";
}

} // namespace

HttpBackend::HttpBackend(asio::io_context& io,
                         DaemonSupervisor& supervisor,
                         std::shared_ptr<Logger> logger)
  : io_(io),
    supervisor_(supervisor),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("http")) {
  supervisor_.add_health_listener([this](DaemonHealth health){
    if(!health_listener_) return;
    health_listener_(health == DaemonHealth::Recovered ? BackendHealth::Recovered : BackendHealth::Lost);
  });
}

void HttpBackend::set_health_listener(HealthListener listener) {
  health_listener_ = std::move(listener);
}

json HttpBackend::add_uri_options(const DownloadRequest& request) {
  json options = {
    {"dir", request.destination},
    {"continue", "true"},
    {"allow-overwrite", "true"}
  };
  if(request.filename && !request.filename->empty()) {
    options["out"] = *request.filename;
  }
  if(!request.headers.empty()) {
    json headers = json::array();
    for(const auto& [name, value] : request.headers) {
      headers.push_back(name + ": " + value);
    }
    options["header"] = std::move(headers);
  }
  return options;
}

bool HttpBackend::task_matches(const json& task, const DownloadRequest& request, bool include_finished) {
  if(!task.is_object()) return false;
  const auto state = task.value("status", std::string());
  if(!(include_finished ? reusable_status(state) : unfinished_status(state))) return false;
  if(!same_directory(task.value("dir", std::string()), request.destination)) return false;
  if(request.filename && !request.filename->empty()) {
    auto path = first_file_path(task);
    if(!path.empty() && fs::path(path).filename().string() != *request.filename) return false;
  }
  if(!task.contains("files") || !task["files"].is_array()) return false;
  for(const auto& file : task["files"]) {
    if(!file.contains("uris") || !file["uris"].is_array()) continue;
    for(const auto& uri : file["uris"]) {
      if(uri.value("uri", std::string()) == request.url) return true;
    }
  }
  return false;
}

ProgressSample HttpBackend::map_status(const json& status) {
  ProgressSample sample;
  std::string state = status.value("status", std::string());
  if(state == "paused") {
    sample.status = DownloadStatus::Paused;
  } else if(state == "complete") {
    sample.status = DownloadStatus::Completed;
  } else if(state == "error") {
    sample.status = DownloadStatus::Error;
    sample.error = status.value("errorMessage", std::string());
    if(sample.error.empty()) {
      sample.error = "aria2 error code " + status.value("errorCode", std::string("?"));
    }
  } else if(state == "removed") {
    sample.status = DownloadStatus::Cancelled;
  } else {
    // active, waiting and anything new
    sample.status = DownloadStatus::Active;
  }

  sample.total = status.contains("totalLength") ? parse_u64(status["totalLength"]) : 0;
  sample.downloaded = status.contains("completedLength") ? parse_u64(status["completedLength"]) : 0;
  if(sample.total > 0 && sample.downloaded > sample.total) {
    sample.downloaded = sample.total;
  }
  sample.download_speed = status.contains("downloadSpeed") ? parse_u64(status["downloadSpeed"]) : 0;
  sample.upload_speed = status.contains("uploadSpeed") ? parse_u64(status["uploadSpeed"]) : 0;

  auto path = first_file_path(status);
  if(!path.empty()) {
    sample.file_name = fs::path(path).filename().string();
  }
  return sample;
}

void HttpBackend::start(const DownloadRequest& request, StartHandler done) {
  if(supervisor_.state() == SupervisorState::Failed) {
    // A new transfer is the cue to try bringing a lost daemon back.
    supervisor_.initialize([this, request, done = std::move(done)](const OpStatus& status) mutable {
      if(!status.ok()) {
        done(status, std::string());
        return;
      }
      start(request, std::move(done));
    });
    return;
  }
  // Only a task still in progress is adopted; the coordinator never hands
  // this a target another download is using.
  discover(request, false, [this, request, done = std::move(done)](const OpStatus& status,
                                                             const std::string& gid,
                                                             const std::string&) mutable {
    if(!status.ok()) {
      done(status, std::string());
      return;
    }
    if(!gid.empty()) {
      logger_->info("re-attached {} to existing task {}", request.url, gid);
      done(OpStatus::success(), gid);
      return;
    }
    add_uri(request, std::move(done));
  });
}

void HttpBackend::add_uri(const DownloadRequest& request, StartHandler done) {
  json params = json::array({json::array({request.url}), add_uri_options(request)});
  supervisor_.call("aria2.addUri", std::move(params),
    [this, url = request.url, done = std::move(done)](const OpStatus& status, const json& result){
      if(!status.ok()) {
        done(status, std::string());
        return;
      }
      if(!result.is_string()) {
        done(OpStatus::failure(ErrorKind::Transfer, "addUri returned no GID"), std::string());
        return;
      }
      auto gid = result.get<std::string>();
      logger_->debug("added {} as {}", url, gid);
      done(OpStatus::success(), gid);
    });
}

void HttpBackend::discover(const DownloadRequest& request, bool include_finished, FindHandler done) {
  discover_in(0, request, include_finished, std::move(done));
}

void HttpBackend::discover_in(std::size_t list_index,
                              const DownloadRequest& request,
                              bool include_finished,
                              FindHandler done) {
  static const std::array<const char*, 3> methods = {
    "aria2.tellActive", "aria2.tellWaiting", "aria2.tellStopped"
  };
  if(list_index >= methods.size()) {
    done(OpStatus::success(), std::string(), std::string());
    return;
  }
  json params = list_index == 0
    ? json::array({task_keys()})
    : json::array({0, 1000, task_keys()});
  supervisor_.call(methods[list_index], std::move(params),
    [this, list_index, request, include_finished, done = std::move(done)](const OpStatus& status, const json& result) mutable {
      if(!status.ok()) {
        done(status, std::string(), std::string());
        return;
      }
      if(result.is_array()) {
        for(const auto& task : result) {
          if(task_matches(task, request, include_finished)) {
            done(OpStatus::success(), task.value("gid", std::string()), task.value("status", std::string()));
            return;
          }
        }
      }
      discover_in(list_index + 1, request, include_finished, std::move(done));
    });
}

void HttpBackend::locate(const std::string& gid, const DownloadRequest& request, FindHandler done) {
  auto fall_back = [this, request, done](){
    discover(request, true, [this, request, done](const OpStatus& status,
                                            const std::string& found,
                                            const std::string& state){
      if(!status.ok() || !found.empty()) {
        done(status, found, state);
        return;
      }
      add_uri(request, [done](const OpStatus& added, const std::string& fresh){
        done(added, fresh, "waiting");
      });
    });
  };

  if(gid.empty()) {
    fall_back();
    return;
  }
  supervisor_.call("aria2.tellStatus", json::array({gid, task_keys()}),
    [gid, done, fall_back](const OpStatus& status, const json& result){
      if(status.ok() && reusable_status(result.value("status", std::string()))) {
        done(status, gid, result.value("status", std::string()));
        return;
      }
      if(!status.ok() && status.retryable) {
        done(status, std::string(), std::string());
        return;
      }
      fall_back();
    });
}

void HttpBackend::pause(const std::string& handle, StatusHandler done) {
  supervisor_.call("aria2.pause", json::array({handle}),
    [this, handle, done = std::move(done)](const OpStatus& status, const json&){
      if(status.ok() || status.retryable) {
        done(status);
        return;
      }
      // Already paused or waiting to pause is not an error.
      supervisor_.call("aria2.tellStatus", json::array({handle, json::array({"status"})}),
        [status, done](const OpStatus& state, const json& result){
          if(state.ok() && result.value("status", std::string()) == "paused") {
            done(OpStatus::success());
            return;
          }
          done(status);
        });
    });
}

void HttpBackend::resume(const std::string& handle, const DownloadRequest& request, StartHandler done) {
  supervisor_.call("aria2.unpause", json::array({handle}),
    [this, handle, request, done = std::move(done)](const OpStatus& status, const json&) mutable {
      if(status.ok()) {
        done(status, handle);
        return;
      }
      if(status.retryable) {
        done(status, std::string());
        return;
      }
      logger_->debug("unpause {} failed ({}), locating task", handle, status.message);
      locate(handle, request, [this, done = std::move(done)](const OpStatus& found,
                                                             const std::string& gid,
                                                             const std::string& state) mutable {
        if(!found.ok()) {
          done(found, std::string());
          return;
        }
        if(state == "paused") {
          unpause_task(gid, std::move(done));
          return;
        }
        done(found, gid);
      });
    });
}

void HttpBackend::unpause_task(const std::string& gid, StartHandler done) {
  supervisor_.call("aria2.unpause", json::array({gid}),
    [gid, done = std::move(done)](const OpStatus& status, const json&){
      done(status, status.ok() ? gid : std::string());
    });
}

void HttpBackend::reattach(const std::string& handle, const DownloadRequest& request, StartHandler done) {
  locate(handle, request, [done = std::move(done)](const OpStatus& status,
                                                   const std::string& gid,
                                                   const std::string&){
    done(status, gid);
  });
}

void HttpBackend::cancel(const std::string& handle,
                         const DownloadRequest& request,
                         CleanupPolicy policy,
                         StatusHandler done) {
  supervisor_.call("aria2.tellStatus", json::array({handle, task_keys()}),
    [this, handle, request, policy, done = std::move(done)](const OpStatus& state, const json& result) mutable {
      fs::path partial;
      if(state.ok()) {
        auto path = first_file_path(result);
        if(!path.empty()) partial = path;
      }
      if(partial.empty() && request.filename && !request.filename->empty()) {
        partial = fs::path(request.destination) / *request.filename;
      }

      supervisor_.call("aria2.remove", json::array({handle}),
        [this, handle, policy, partial, done = std::move(done)](const OpStatus& removed, const json&) mutable {
          if(!removed.ok()) {
            logger_->debug("aria2.remove {}: {}", handle, removed.message);
          }
          auto finish = [this, policy, partial, removed, done = std::move(done)](const OpStatus&){
            if(policy == CleanupPolicy::Temp && !partial.empty()) {
              std::error_code ec;
              fs::remove(partial, ec);
              fs::remove(fs::path(partial.string() + ".aria2"), ec);
              logger_->debug("removed partial file {}", partial.string());
            }
            // Best effort: only an unreachable daemon is worth reporting.
            done(removed.retryable ? removed : OpStatus::success());
          };
          if(removed.retryable) {
            finish(removed);
            return;
          }
          remove_result(handle, 5, std::move(finish));
        });
    });
}

void HttpBackend::remove_result(const std::string& gid, int attempts_left, StatusHandler done) {
  supervisor_.call("aria2.removeDownloadResult", json::array({gid}),
    [this, gid, attempts_left, done = std::move(done)](const OpStatus& status, const json&) mutable {
      if(status.ok() || status.retryable || attempts_left <= 1) {
        done(OpStatus::success());
        return;
      }
      // aria2 only drops results of stopped tasks; remove() stops asynchronously.
      auto timer = std::make_shared<asio::steady_timer>(io_, std::chrono::milliseconds(200));
      timer->async_wait([this, timer, gid, attempts_left, done = std::move(done)](const std::error_code&) mutable {
        remove_result(gid, attempts_left - 1, std::move(done));
      });
    });
}

void HttpBackend::sample(const std::string& handle, SampleHandler done) {
  supervisor_.call("aria2.tellStatus", json::array({handle, status_keys()}),
    [done = std::move(done)](const OpStatus& status, const json& result){
      if(!status.ok()) {
        done(status, ProgressSample{});
        return;
      }
      done(status, map_status(result));
    });
}

void HttpBackend::release(const std::string& handle, StatusHandler done) {
  supervisor_.call("aria2.removeDownloadResult", json::array({handle}),
    [this, handle, done = std::move(done)](const OpStatus& status, const json&){
      if(!status.ok()) {
        logger_->debug("release {}: {}", handle, status.message);
      }
      if(done) done(status.retryable ? status : OpStatus::success());
    });
}
