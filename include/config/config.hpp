#ifndef PCLOUD_CONFIG_HPP
#define PCLOUD_CONFIG_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include "logger/logger.hpp"

namespace pcloud {
namespace config {

class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& message) : std::runtime_error("Config error: " + message) {}
};

struct Endpoint {
  std::string host;
  uint16_t port{0};
};

struct ServerConfig {
  Endpoint listen_addr;
  std::uint64_t max_file_size{0};
  std::filesystem::path storage_path;
  // Empty means <storage_path>/.scratch
  std::filesystem::path scratch_path;
  unsigned threads{2};
  logger::LogOptions log;
};

struct ClientConfig {
  Endpoint server;
  std::filesystem::path download_dir;
  std::filesystem::path key_path;
  logger::LogOptions log;
};

// ---- LOADING ----
// JSON files; throws ConfigError on missing or invalid fields
ServerConfig load_server_config(const std::filesystem::path& path);
ClientConfig load_client_config(const std::filesystem::path& path);

// ---- PARSING HELPERS ----
// "host:port"
Endpoint parse_endpoint(const std::string& text);
// "http://host:port[/]"
Endpoint parse_server_url(const std::string& text);

} // namespace config
} // namespace pcloud

#endif // PCLOUD_CONFIG_HPP
