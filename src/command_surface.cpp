#include "command_surface.hpp"

#include <cctype>
#include <stdexcept>

#include "download_coordinator.hpp"
#include "errors.hpp"
#include "history_sink.hpp"
#include "magnet_uri.hpp"
#include "url_classifier.hpp"

using json = nlohmann::json;

namespace {

json ok_reply(json value) {
  return json{{"ok", true}, {"value", std::move(value)}};
}

json error_reply(const std::string& text) {
  return json{{"ok", false}, {"error", text}};
}

class UsageError : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

} // namespace

CommandSurface::CommandSurface(DownloadCoordinator& coordinator,
                               Options options,
                               std::shared_ptr<Logger> logger)
  : coordinator_(coordinator),
    options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("commands")) {}

std::vector<std::string> CommandSurface::tokenize(const std::string& line) {
  std::vector<std::string> tokens;
  std::string current;
  bool in_token = false;
  bool in_quotes = false;
  for(std::size_t i = 0; i < line.size(); ++i) {
    char ch = line[i];
    if(in_quotes) {
      if(ch == '\\' && i + 1 < line.size()) {
        current.push_back(line[++i]);
      } else if(ch == '"') {
        in_quotes = false;
      } else {
        current.push_back(ch);
      }
      continue;
    }
    if(ch == '"') {
      in_quotes = true;
      in_token = true;
    } else if(std::isspace(static_cast<unsigned char>(ch))) {
      if(in_token) {
        tokens.push_back(current);
        current.clear();
        in_token = false;
      }
    } else {
      current.push_back(ch);
      in_token = true;
    }
  }
  if(in_quotes) {
    throw UsageError("unbalanced quotes");
  }
  if(in_token) {
    tokens.push_back(current);
  }
  return tokens;
}

std::string CommandSurface::help_text() {
  return
    "submit <url> [dir=<path>] [name=<file>] [header=\"Name: value\"]... [cleanup=persist|temp] [extract]\n"
    "pause <id> | resume <id> | cancel <id> | retry <id> | stop-seeding <id>\n"
    "get <id> | list [active] | clear <id> | clear-finished\n"
    "classify <url> | status | history [count] | help | quit";
}

std::string CommandSurface::execute(const std::string& line) {
  return execute_json(line).dump();
}

json CommandSurface::execute_json(const std::string& line) {
  try {
    auto args = tokenize(line);
    if(args.empty()) {
      return error_reply("UsageError: empty command");
    }
    return run(args);
  } catch(const DownloadError& e) {
    logger_->debug("command '{}' failed: {}", line, e.describe());
    return error_reply(e.describe());
  } catch(const UsageError& e) {
    return error_reply(std::string("UsageError: ") + e.what());
  } catch(const std::exception& e) {
    logger_->error("command '{}' raised: {}", line, e.what());
    return error_reply(std::string("InternalError: ") + e.what());
  }
}

const std::string& CommandSurface::require_id(const std::vector<std::string>& args) const {
  if(args.size() != 2) {
    throw UsageError(args[0] + " takes exactly one download id");
  }
  return args[1];
}

json CommandSurface::run(const std::vector<std::string>& args) {
  const auto& command = args[0];

  if(command == "submit") {
    return submit(args);
  }
  if(command == "pause") {
    coordinator_.pause(require_id(args));
    return ok_reply(coordinator_.get(args[1]));
  }
  if(command == "resume") {
    coordinator_.resume(require_id(args));
    return ok_reply(coordinator_.get(args[1]));
  }
  if(command == "cancel") {
    coordinator_.cancel(require_id(args));
    return ok_reply(coordinator_.get(args[1]));
  }
  if(command == "retry") {
    coordinator_.retry(require_id(args));
    return ok_reply(coordinator_.get(args[1]));
  }
  if(command == "stop-seeding" || command == "stop_seeding") {
    coordinator_.stop_seeding(require_id(args));
    return ok_reply(coordinator_.get(args[1]));
  }
  if(command == "get") {
    return ok_reply(coordinator_.get(require_id(args)));
  }
  if(command == "list") {
    auto records = coordinator_.list();
    if(args.size() == 1) return ok_reply(records);
    if(args.size() != 2 || args[1] != "active") {
      throw UsageError("list takes no argument or 'active'");
    }
    json active = json::array();
    for(const auto& record : records) {
      if(!is_terminal(record.status)) active.push_back(record);
    }
    return ok_reply(std::move(active));
  }
  if(command == "classify") {
    if(args.size() != 2) {
      throw UsageError("classify takes exactly one url");
    }
    auto kind = classify_url(args[1]);
    json value = {{"url", args[1]}, {"kind", to_string(kind)}};
    if(kind == TransportKind::Peer) {
      value["info_hash"] = parse_magnet(args[1]).info_hash;
    }
    return ok_reply(std::move(value));
  }
  if(command == "clear") {
    coordinator_.clear(require_id(args));
    return ok_reply(args[1]);
  }
  if(command == "clear-finished" || command == "clear_finished") {
    return ok_reply(coordinator_.clear_finished());
  }
  if(command == "status") {
    return ok_reply(options_.status ? options_.status() : json::object());
  }
  if(command == "history") {
    if(!options_.history) return ok_reply(json::array());
    std::size_t limit = 20;
    if(args.size() > 1) {
      try {
        limit = static_cast<std::size_t>(std::stoul(args[1]));
      } catch(const std::exception&) {
        throw UsageError("history count must be a number");
      }
    }
    return ok_reply(options_.history->read(limit));
  }
  if(command == "help") {
    return ok_reply(help_text());
  }
  if(command == "quit" || command == "exit") {
    quit_requested_ = true;
    return ok_reply("bye");
  }
  throw UsageError("unknown command '" + command + "' (try help)");
}

json CommandSurface::submit(const std::vector<std::string>& args) {
  if(args.size() < 2) {
    throw UsageError("submit needs a url");
  }
  DownloadRequest request;
  request.url = args[1];
  request.cleanup = options_.default_cleanup;

  for(std::size_t i = 2; i < args.size(); ++i) {
    const auto& option = args[i];
    if(option == "extract") {
      request.auto_extract = true;
      continue;
    }
    auto eq = option.find('=');
    if(eq == std::string::npos) {
      throw UsageError("unexpected argument '" + option + "'");
    }
    auto key = option.substr(0, eq);
    auto value = option.substr(eq + 1);
    if(key == "dir") {
      request.destination = value;
    } else if(key == "name") {
      request.filename = value;
    } else if(key == "header") {
      auto colon = value.find(':');
      if(colon == std::string::npos || colon == 0) {
        throw UsageError("header must look like \"Name: value\"");
      }
      auto name = value.substr(0, colon);
      auto content = value.substr(colon + 1);
      while(!content.empty() && content.front() == ' ') content.erase(content.begin());
      request.headers[name] = content;
    } else if(key == "cleanup") {
      auto policy = cleanup_policy_from_string(value);
      if(!policy) throw UsageError("cleanup must be persist or temp");
      request.cleanup = *policy;
    } else {
      throw UsageError("unknown submit option '" + key + "'");
    }
  }

  auto id = coordinator_.submit(std::move(request));
  return ok_reply(coordinator_.get(id));
}
