#ifndef PCLOUD_HTTP_SESSION_HPP
#define PCLOUD_HTTP_SESSION_HPP

#include <exception>
#include <memory>
#include <optional>
#include <vector>
#include <boost/asio/thread_pool.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include "server/download_pipeline.hpp"
#include "server/upload_pipeline.hpp"
#include "store/store.hpp"

namespace pcloud {
namespace server {

namespace beast = boost::beast;
namespace http = boost::beast::http;

// One connection. Network reads run on the connection's strand; disk work is
// posted to the shared disk pool and resumes on the strand when done.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
  // ---- CONSTRUCTOR ----
  HttpSession(boost::asio::ip::tcp::socket&& socket, store::Store& store,
              boost::asio::thread_pool& disk_pool, std::uint64_t max_file_size);
  ~HttpSession();

  // ---- STARTUP ----
  void run();

private:
  // ---- PARAMETERS ----
  beast::tcp_stream stream_;
  beast::flat_buffer buffer_;
  store::Store& store_;
  boost::asio::thread_pool& disk_pool_;
  std::uint64_t max_file_size_;
  std::optional<http::request_parser<http::buffer_body>> parser_;
  std::unique_ptr<UploadPipeline> upload_;
  std::vector<char> chunk_;
  bool keep_alive_ = false;

  static constexpr size_t CHUNK_SIZE = 64 * 1024;


  // ---- REQUEST ROUTING ----
  void do_read_header();
  void on_read_header(beast::error_code ec, std::size_t bytes);
  void route_request();


  // ---- UPLOAD ----
  void start_upload();
  void do_read_body();
  void on_read_body(beast::error_code ec, std::size_t bytes);
  void finish_upload();


  // ---- DOWNLOAD ----
  void start_download();


  // ---- RESPONSES ----
  void send_ok();
  void send_error(std::exception_ptr error);
  void send_error(http::status status, const std::string& message);
  template <class Body>
  void send_response(std::shared_ptr<http::response<Body>> response);
  void on_write(bool close, beast::error_code ec, std::size_t bytes);
  void do_close();

  // Runs work on the disk pool, then continues on this session's strand with
  // the exception it raised (or null)
  template <class Work, class Next>
  void post_disk(Work work, Next next);
};

// Maps error kinds to HTTP statuses
http::status status_for(const std::exception_ptr& error);

} // namespace server
} // namespace pcloud

#endif // PCLOUD_HTTP_SESSION_HPP
