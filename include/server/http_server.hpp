#pragma once

#include <boost/asio.hpp>
#include <boost/log/trivial.hpp>
#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include "config/config.hpp"
#include "store/store.hpp"

namespace pcloud {
namespace server {

class HttpServer {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  HttpServer(const config::ServerConfig& config, store::Store& store);
  ~HttpServer();


  // ---- INITIALIZATION AND TEARDOWN ----
  // Binds the listen address and starts the IO threads; false if already running or bind failed
  bool start_listener();
  void shutdown();


  // ---- GETTERS ----
  // Actual bound port, useful when configured with port 0
  uint16_t port() const;
  bool is_running() const { return is_running_; }

private:

  // ---- PARAMETERS ----
  const config::ServerConfig config_;
  store::Store& store_;

  // Server state
  std::atomic<bool> is_running_;
  std::vector<std::thread> io_threads_;

  // Incoming connection handlers
  using WorkGuard = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;
  std::unique_ptr<boost::asio::io_context> io_context_;
  std::unique_ptr<WorkGuard> work_guard_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
  // Blocking file operations never run on the IO threads
  std::unique_ptr<boost::asio::thread_pool> disk_pool_;


  // ---- INITIALIZATION AND TEARDOWN ----
  // Main listening loop that handles incoming connections
  void start_accept();
};

} // namespace server
} // namespace pcloud
