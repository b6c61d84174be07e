#include "config/config.hpp"
#include <cstdlib>
#include <boost/log/trivial.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

namespace pcloud {
namespace config {

namespace pt = boost::property_tree;

namespace {

pt::ptree read_json_file(const std::filesystem::path& path) {
  pt::ptree tree;
  try {
    pt::read_json(path.string(), tree);
  } catch (const pt::file_parser_error& e) {
    throw ConfigError("Unable to parse config file " + path.string() + ": " + e.what());
  }
  return tree;
}

template <typename T>
T required(const pt::ptree& tree, const std::string& key) {
  auto value = tree.get_optional<T>(key);
  if (!value) {
    throw ConfigError("Missing or invalid field: " + key);
  }
  return *value;
}

logger::LogOptions read_log_options(const pt::ptree& tree, logger::LogOptions defaults) {
  if (auto file = tree.get_optional<std::string>("log_file")) {
    defaults.log_file = *file;
  }
  if (auto level = tree.get_optional<std::string>("log_level")) {
    boost::log::trivial::severity_level severity;
    if (!boost::log::trivial::from_string(level->c_str(), level->size(), severity)) {
      throw ConfigError("Invalid log_level: " + *level);
    }
    defaults.min_severity = severity;
  }
  return defaults;
}

std::filesystem::path default_key_path() {
  const char* home = std::getenv("HOME");
  std::filesystem::path base = home ? home : ".";
  return base / ".pcloud" / "signing_key.pem";
}

} // namespace


//==============================================
// PARSING HELPERS
//==============================================

Endpoint parse_endpoint(const std::string& text) {
  const auto colon = text.rfind(':');
  if (colon == std::string::npos || colon == 0 || colon + 1 == text.size()) {
    throw ConfigError("Invalid address, expected host:port: " + text);
  }

  Endpoint endpoint;
  endpoint.host = text.substr(0, colon);
  if (endpoint.host.size() > 2 && endpoint.host.front() == '[' && endpoint.host.back() == ']') {
    endpoint.host = endpoint.host.substr(1, endpoint.host.size() - 2);
  }

  const std::string port = text.substr(colon + 1);
  if (port.find_first_not_of("0123456789") != std::string::npos || port.size() > 5) {
    throw ConfigError("Invalid port: " + port);
  }
  const unsigned long value = std::stoul(port);
  if (value > 65535) {
    throw ConfigError("Invalid port: " + port);
  }
  endpoint.port = static_cast<uint16_t>(value);
  return endpoint;
}

Endpoint parse_server_url(const std::string& text) {
  const std::string scheme = "http://";
  if (text.compare(0, scheme.size(), scheme) != 0) {
    throw ConfigError("Only http:// server URLs are supported: " + text);
  }
  std::string authority = text.substr(scheme.size());
  const auto slash = authority.find('/');
  if (slash != std::string::npos) {
    if (slash + 1 != authority.size()) {
      throw ConfigError("Server URL must not contain a path: " + text);
    }
    authority.erase(slash);
  }
  if (authority.find(':') == std::string::npos || authority.back() == ']') {
    authority += ":80";
  }
  return parse_endpoint(authority);
}


//==============================================
// LOADING
//==============================================

ServerConfig load_server_config(const std::filesystem::path& path) {
  BOOST_LOG_TRIVIAL(debug) << "Config: Loading server config from " << path.string();
  const auto tree = read_json_file(path);

  ServerConfig config;
  config.listen_addr = parse_endpoint(required<std::string>(tree, "listen_addr"));
  config.max_file_size = required<std::uint64_t>(tree, "max_file_size");
  config.storage_path = required<std::string>(tree, "storage_path");
  config.scratch_path = tree.get<std::string>("scratch_path", "");
  config.threads = tree.get<unsigned>("threads", 2);
  config.log = read_log_options(tree, logger::LogOptions{});

  if (config.storage_path.empty()) {
    throw ConfigError("storage_path must not be empty");
  }
  if (config.threads == 0) {
    throw ConfigError("threads must be at least 1");
  }
  return config;
}

ClientConfig load_client_config(const std::filesystem::path& path) {
  BOOST_LOG_TRIVIAL(debug) << "Config: Loading client config from " << path.string();
  const auto tree = read_json_file(path);

  ClientConfig config;
  config.server = parse_server_url(required<std::string>(tree, "server_url"));
  config.download_dir = required<std::string>(tree, "download_dir");
  config.key_path = tree.get<std::string>("key_path", default_key_path().string());

  logger::LogOptions defaults;
  defaults.min_severity = boost::log::trivial::warning;
  config.log = read_log_options(tree, defaults);

  if (config.download_dir.empty()) {
    throw ConfigError("download_dir must not be empty");
  }
  return config;
}

} // namespace config
} // namespace pcloud
