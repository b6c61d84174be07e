#include "server/http_server.hpp"
#include "server/http_session.hpp"

namespace pcloud {
namespace server {

namespace {
constexpr size_t DISK_POOL_THREADS = 4;
}

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

HttpServer::HttpServer(const config::ServerConfig& config, store::Store& store)
  : config_(config)
  , store_(store)
  , is_running_(false) {
  BOOST_LOG_TRIVIAL(info) << "HTTP server: Initializing HTTP server on "
                          << config_.listen_addr.host << ":" << config_.listen_addr.port;
}

HttpServer::~HttpServer() {
  shutdown();
}


//==============================================
// INITIALIZATION AND TEARDOWN
//==============================================

bool HttpServer::start_listener() {
  if (is_running_) {
    BOOST_LOG_TRIVIAL(warning) << "HTTP server: Server already running";
    return false;
  }

  try {
    io_context_ = std::make_unique<boost::asio::io_context>(static_cast<int>(config_.threads));
    disk_pool_ = std::make_unique<boost::asio::thread_pool>(DISK_POOL_THREADS);
    work_guard_ = std::make_unique<WorkGuard>(io_context_->get_executor());

    // Resolve listen address to an endpoint
    boost::asio::ip::tcp::resolver resolver(*io_context_);
    auto endpoints = resolver.resolve(config_.listen_addr.host, std::to_string(config_.listen_addr.port),
                                      boost::asio::ip::tcp::resolver::passive);
    if (endpoints.empty()) {
      BOOST_LOG_TRIVIAL(error) << "HTTP server: Unable to resolve listen address";
      return false;
    }

    BOOST_LOG_TRIVIAL(debug) << "HTTP server: Acceptor created";
    acceptor_ = std::make_unique<boost::asio::ip::tcp::acceptor>(*io_context_, endpoints.begin()->endpoint());

    is_running_ = true;

    // Start accepting connections
    BOOST_LOG_TRIVIAL(debug) << "HTTP server: Starting to accept connections";
    start_accept();

    BOOST_LOG_TRIVIAL(debug) << "HTTP server: Starting " << config_.threads << " IO threads";
    for (unsigned i = 0; i < config_.threads; ++i) {
      io_threads_.emplace_back([this]() {
        try {
          io_context_->run();
        } catch (const std::exception& e) {
          BOOST_LOG_TRIVIAL(error) << "HTTP server: IO context error: " << e.what();
        }
      });
    }

    BOOST_LOG_TRIVIAL(info) << "HTTP server: Started web server on " << acceptor_->local_endpoint();
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "HTTP server: Failed to start server: " << e.what();
    is_running_ = false;
    acceptor_.reset();
    return false;
  }
}

void HttpServer::start_accept() {
  if (!acceptor_ || !is_running_) {
    return;
  }

  // Every connection gets its own strand
  acceptor_->async_accept(boost::asio::make_strand(*io_context_),
    [this](const boost::system::error_code& error, boost::asio::ip::tcp::socket socket) {
      if (!error) {
        boost::system::error_code ec;
        BOOST_LOG_TRIVIAL(debug) << "HTTP server: Accepted connection from " << socket.remote_endpoint(ec);
        std::make_shared<HttpSession>(std::move(socket), store_, *disk_pool_, config_.max_file_size)->run();
      } else if (error == boost::asio::error::operation_aborted) {
        return;
      } else {
        BOOST_LOG_TRIVIAL(error) << "HTTP server: Accept error: " << error.message();
      }
      start_accept();  // Continue accepting new connections
    });
}

void HttpServer::shutdown() {
  if (!is_running_) {
    return;
  }

  BOOST_LOG_TRIVIAL(info) << "HTTP server: Initiating server shutdown";

  is_running_ = false;

  // Stop accepting new connections
  if (acceptor_ && acceptor_->is_open()) {
    boost::system::error_code ec;
    acceptor_->close(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "HTTP server: Error closing acceptor: " << ec.message();
    }
  }

  // Stop the IO threads, then let in-flight disk work drain
  work_guard_.reset();
  io_context_->stop();
  for (auto& thread : io_threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  io_threads_.clear();
  disk_pool_->join();

  // Destroying the context destroys queued sessions, which removes their scratch files
  acceptor_.reset();
  io_context_.reset();
  disk_pool_.reset();

  BOOST_LOG_TRIVIAL(info) << "HTTP server: Gracefully shut down";
}


//==============================================
// GETTERS
//==============================================

uint16_t HttpServer::port() const {
  if (!acceptor_) {
    return 0;
  }
  boost::system::error_code ec;
  auto endpoint = acceptor_->local_endpoint(ec);
  return ec ? 0 : endpoint.port();
}

} // namespace server
} // namespace pcloud
