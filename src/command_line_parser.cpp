#include "command_line_parser.hpp"

#include <cctype>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "command_surface.hpp"
#include "log.hpp"

namespace {

const char* section_of(const std::string& key) {
  if(key.rfind("rpc_", 0) == 0 || key.rfind("daemon", 0) == 0 || key == "resource_dir" ||
     key == "startup_timeout_ms" || key == "shutdown_timeout_ms" || key == "split" ||
     key == "max_connections_per_server" || key == "max_concurrent_downloads" || key == "min_split_size") {
    return "aria2 daemon";
  }
  if(key.rfind("peer_", 0) == 0 || key.rfind("enable_", 0) == 0 || key.find("rate_limit") != std::string::npos ||
     key == "seed_after_download") {
    return "swarm";
  }
  return "general";
}

} // namespace

CommandLineParser::CommandLineParser(std::string process_name, nlohmann::json settings_spec)
  : process_name_(std::move(process_name)),
    settings_spec_(std::move(settings_spec)) {}

bool CommandLineParser::is_option_token(const std::string& candidate) {
  if(candidate.rfind("--", 0) == 0) return true;
  return candidate.size() >= 2 && candidate[0] == '-' &&
         std::isalpha(static_cast<unsigned char>(candidate[1]));
}

bool CommandLineParser::is_bool_literal(const std::string& value) {
  std::string lowered = SettingsManager::to_lower(SettingsManager::trim_copy(value));
  return lowered == "true" || lowered == "false" ||
         lowered == "on" || lowered == "off" ||
         lowered == "1" || lowered == "0" ||
         lowered == "yes" || lowered == "no";
}

std::vector<std::string> CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) {
    args.assign(argv + 1, argv + argc);
  }
  std::vector<std::string> urls;

  for(std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];
    if(!is_option_token(token)) {
      urls.push_back(token);
      continue;
    }

    std::string body = token.substr(token[1] == '-' ? 2 : 1);
    auto eq = body.find('=');
    std::string name = body.substr(0, eq);
    auto key = settings.resolve_key(name);

    // --no-dht style negation for booleans.
    if(!key && eq == std::string::npos && name.rfind("no-", 0) == 0) {
      auto negated = settings.resolve_key(name.substr(3));
      if(negated && settings.is_bool_setting(*negated)) {
        std::string error;
        if(!settings.set_from_string(*negated, "false", error)) {
          throw std::invalid_argument("Invalid option " + token + ": " + error);
        }
        continue;
      }
    }
    if(!key) {
      throw std::invalid_argument("Unknown option " + token);
    }

    std::string value;
    if(eq != std::string::npos) {
      value = body.substr(eq + 1);
    } else if(settings.is_bool_setting(*key)) {
      value = "true";
      if(i + 1 < args.size() && is_bool_literal(args[i + 1])) {
        value = args[++i];
      }
    } else if(i + 1 < args.size()) {
      value = args[++i];
    } else {
      throw std::invalid_argument("Missing value for option '" + name + "'");
    }

    std::string error;
    if(!settings.set_from_string(*key, value, error)) {
      throw std::invalid_argument("Invalid value for option '" + name + "': " + error);
    }
  }
  return urls;
}

std::string CommandLineParser::describe_default(const nlohmann::json& entry) {
  const auto& value = entry.at("default");
  if(value.is_boolean()) return value.get<bool>() ? "true" : "false";
  if(value.is_string()) {
    auto text = value.get<std::string>();
    return text.empty() ? std::string("none") : text;
  }
  return value.dump();
}

void CommandLineParser::usage() const {
  console_out("{} - segmented HTTP and swarm download service", process_name_);
  console_out("Usage:");
  console_out("  {} [options] [url|magnet ...]", process_name_);

  for(const char* section : {"general", "aria2 daemon", "swarm"}) {
    console_out("");
    console_out("Options ({}):", section);
    for(const auto& entry : settings_spec_) {
      auto key = entry.at("key").get<std::string>();
      if(std::string(section_of(key)) != section) continue;

      auto type = entry.at("type").get<std::string>();
      std::ostringstream aliases;
      for(const auto& alias : entry.value("aliases", nlohmann::json::array())) {
        aliases << (aliases.tellp() == 0 ? " (-" : ", -") << alias.get<std::string>();
      }
      if(aliases.tellp() > 0) aliases << ")";

      console_out("  --{:<28} {:<14} {}{} [{}]",
                  key,
                  type == "bool" ? "[true|false]" : "<" + type + ">",
                  entry.value("description", ""),
                  aliases.str(),
                  describe_default(entry));
    }
  }

  console_out("");
  console_out("Commands on stdin, one per line; each gets one JSON reply:");
  std::istringstream commands(CommandSurface::help_text());
  std::string line;
  while(std::getline(commands, line)) {
    console_out("  {}", line);
  }
}
