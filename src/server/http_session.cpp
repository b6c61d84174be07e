#include "server/http_session.hpp"
#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/log/trivial.hpp>
#include "protocol/constants.hpp"
#include "protocol/protocol_error.hpp"
#include "protocol/signed_request.hpp"

namespace pcloud {
namespace server {

namespace {

constexpr const char* SERVER_NAME = "pcloud";

using RequestHeader = http::request_parser<http::buffer_body>::value_type;

std::string header_value(const RequestHeader& request, const char* name) {
  auto it = request.find(name);
  if (it == request.end()) {
    throw protocol::MalformedInputError(std::string("Header not found: ") + name);
  }
  return std::string(it->value().data(), it->value().size());
}

protocol::RequestFields request_fields(const RequestHeader& request) {
  protocol::RequestFields fields;
  fields.filename = header_value(request, protocol::PARAM_FILENAME);
  fields.pubkey = header_value(request, protocol::PARAM_PUBKEY);
  fields.time = header_value(request, protocol::PARAM_TIME);
  fields.request_signature = header_value(request, protocol::PARAM_REQUEST_SIGNATURE);
  return fields;
}

} // namespace

http::status status_for(const std::exception_ptr& error) {
  try {
    std::rethrow_exception(error);
  } catch (const protocol::ProtocolError& e) {
    switch (e.kind()) {
      case protocol::ErrorKind::MALFORMED_INPUT:
      case protocol::ErrorKind::SANDBOX_VIOLATION: return http::status::bad_request;
      case protocol::ErrorKind::AUTHENTICATION:    return http::status::unauthorized;
      case protocol::ErrorKind::INTEGRITY:         return http::status::unprocessable_entity;
      case protocol::ErrorKind::NOT_FOUND:         return http::status::not_found;
      default:                                     return http::status::internal_server_error;
    }
  } catch (const std::exception&) {
    return http::status::internal_server_error;
  }
}


//==============================================
// CONSTRUCTOR
//==============================================

HttpSession::HttpSession(boost::asio::ip::tcp::socket&& socket, store::Store& store,
                         boost::asio::thread_pool& disk_pool, std::uint64_t max_file_size)
  : stream_(std::move(socket))
  , store_(store)
  , disk_pool_(disk_pool)
  , max_file_size_(max_file_size)
  , chunk_(CHUNK_SIZE) {}

HttpSession::~HttpSession() {
  if (upload_) {
    upload_->abort("connection closed");
  }
}


//==============================================
// STARTUP
//==============================================

void HttpSession::run() {
  boost::asio::dispatch(stream_.get_executor(),
    beast::bind_front_handler(&HttpSession::do_read_header, shared_from_this()));
}

template <class Work, class Next>
void HttpSession::post_disk(Work work, Next next) {
  auto self = shared_from_this();
  boost::asio::post(disk_pool_, [self, work = std::move(work), next = std::move(next)]() mutable {
    std::exception_ptr error;
    try {
      work();
    } catch (const std::exception&) {
      error = std::current_exception();
    }
    boost::asio::post(self->stream_.get_executor(), [self, next = std::move(next), error]() mutable {
      next(error);
    });
  });
}


//==============================================
// REQUEST ROUTING
//==============================================

void HttpSession::do_read_header() {
  parser_.emplace();
  parser_->body_limit(max_file_size_);
  http::async_read_header(stream_, buffer_, *parser_,
    beast::bind_front_handler(&HttpSession::on_read_header, shared_from_this()));
}

void HttpSession::on_read_header(beast::error_code ec, std::size_t) {
  if (ec == http::error::end_of_stream) {
    return do_close();
  }
  if (ec == http::error::body_limit) {
    keep_alive_ = false;
    return send_error(http::status::payload_too_large, "File exceeds the maximum upload size");
  }
  if (ec.category() == http::make_error_code(http::error::bad_target).category() &&
      ec != http::error::partial_message) {
    BOOST_LOG_TRIVIAL(warning) << "Session: Malformed request header: " << ec.message();
    keep_alive_ = false;
    return send_error(http::status::bad_request, "Malformed HTTP request: " + ec.message());
  }
  if (ec) {
    BOOST_LOG_TRIVIAL(debug) << "Session: Header read failed: " << ec.message();
    return;
  }
  keep_alive_ = parser_->keep_alive();
  route_request();
}

void HttpSession::route_request() {
  const auto& request = parser_->get();
  const auto target = request.target();

  if (target == protocol::METHOD_UPLOAD) {
    if (request.method() != http::verb::post) {
      return send_error(http::status::method_not_allowed, "Upload requires POST");
    }
    return start_upload();
  }
  if (target == protocol::METHOD_DOWNLOAD) {
    if (request.method() != http::verb::get) {
      return send_error(http::status::method_not_allowed, "Download requires GET");
    }
    return start_download();
  }

  send_error(http::status::not_found, "Unknown endpoint");
}


//==============================================
// UPLOAD
//==============================================

void HttpSession::start_upload() {
  try {
    const auto& header = parser_->get();
    const auto fields = request_fields(header);
    const auto file_signature_text = header_value(header, protocol::PARAM_FILE_SIGNATURE);

    BOOST_LOG_TRIVIAL(info) << "Upload: " << fields.filename << ", pubkey: " << fields.pubkey
                            << ", time: " << fields.time << ", request signature: " << fields.request_signature
                            << ", file signature: " << file_signature_text;

    auto request = protocol::from_fields(fields);
    const auto file_signature = protocol::decode_signature(file_signature_text);

    // Verification runs before a single body byte is read
    post_disk(
      [this, request = std::move(request), file_signature]() mutable {
        upload_ = std::make_unique<UploadPipeline>(store_, std::move(request), file_signature);
      },
      [this](std::exception_ptr error) {
        if (error) {
          return send_error(error);
        }
        do_read_body();
      });
  } catch (const std::exception&) {
    send_error(std::current_exception());
  }
}

void HttpSession::do_read_body() {
  if (parser_->is_done()) {
    return finish_upload();
  }

  auto& body = parser_->get().body();
  body.data = chunk_.data();
  body.size = chunk_.size();
  http::async_read_some(stream_, buffer_, *parser_,
    beast::bind_front_handler(&HttpSession::on_read_body, shared_from_this()));
}

void HttpSession::on_read_body(beast::error_code ec, std::size_t) {
  if (ec == http::error::need_buffer) {
    ec = {};
  }

  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Upload: Body read error: " << ec.message();
    const bool too_large = (ec == http::error::body_limit);
    post_disk(
      [this, reason = ec.message()] {
        if (upload_) {
          upload_->abort(reason);
          upload_.reset();
        }
      },
      [this, too_large](std::exception_ptr) {
        if (too_large) {
          send_error(http::status::payload_too_large, "File exceeds the maximum upload size");
        }
      });
    return;
  }

  const size_t received = chunk_.size() - parser_->get().body().size;
  if (received == 0) {
    return do_read_body();
  }

  post_disk(
    [this, received] {
      upload_->append_chunk(chunk_.data(), received);
    },
    [this](std::exception_ptr error) {
      if (error) {
        upload_.reset();
        return send_error(error);
      }
      do_read_body();
    });
}

void HttpSession::finish_upload() {
  post_disk(
    [this] {
      upload_->finish();
    },
    [this](std::exception_ptr error) {
      upload_.reset();
      if (error) {
        return send_error(error);
      }
      send_ok();
    });
}


//==============================================
// DOWNLOAD
//==============================================

void HttpSession::start_download() {
  if (!parser_->is_done()) {
    return send_error(http::status::bad_request, "Download requests must not carry a body");
  }

  try {
    const auto fields = request_fields(parser_->get());

    BOOST_LOG_TRIVIAL(info) << "Download: " << fields.filename << ", pubkey: " << fields.pubkey
                            << ", time: " << fields.time << ", request signature: " << fields.request_signature;

    auto request = protocol::from_fields(fields);
    auto artifact = std::make_shared<DownloadArtifact>();

    post_disk(
      [this, request = std::move(request), artifact] {
        *artifact = DownloadPipeline(store_).open(request);
      },
      [this, artifact](std::exception_ptr error) {
        if (error) {
          return send_error(error);
        }
        auto response = std::make_shared<http::response<http::file_body>>(
          http::status::ok, parser_->get().version());
        response->set(http::field::server, SERVER_NAME);
        response->set(http::field::content_type, "application/octet-stream");
        response->set(protocol::PARAM_FILE_SIGNATURE, protocol::encode_signature(artifact->file_signature));
        response->body() = std::move(artifact->body);
        response->prepare_payload();
        send_response(response);
      });
  } catch (const std::exception&) {
    send_error(std::current_exception());
  }
}


//==============================================
// RESPONSES
//==============================================

void HttpSession::send_ok() {
  auto response = std::make_shared<http::response<http::string_body>>(
    http::status::ok, parser_->get().version());
  response->set(http::field::server, SERVER_NAME);
  response->prepare_payload();
  send_response(response);
}

void HttpSession::send_error(std::exception_ptr error) {
  std::string message = "Unknown error";
  try {
    std::rethrow_exception(error);
  } catch (const std::exception& e) {
    message = e.what();
  }
  BOOST_LOG_TRIVIAL(error) << "Session: " << message;
  send_error(status_for(error), message);
}

void HttpSession::send_error(http::status status, const std::string& message) {
  // An unread body leaves the stream unusable for further requests
  if (!parser_->is_done()) {
    keep_alive_ = false;
  }

  auto response = std::make_shared<http::response<http::string_body>>(status, parser_->get().version());
  response->set(http::field::server, SERVER_NAME);
  response->set(http::field::content_type, "text/plain");
  response->body() = message;
  response->prepare_payload();
  send_response(response);
}

template <class Body>
void HttpSession::send_response(std::shared_ptr<http::response<Body>> response) {
  response->keep_alive(keep_alive_);
  const bool close = response->need_eof();
  http::async_write(stream_, *response,
    [self = shared_from_this(), response, close](beast::error_code ec, std::size_t bytes) {
      self->on_write(close, ec, bytes);
    });
}

void HttpSession::on_write(bool close, beast::error_code ec, std::size_t bytes) {
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Session: Write failed: " << ec.message();
    return;
  }
  BOOST_LOG_TRIVIAL(debug) << "Session: Sent response (" << bytes << " bytes)";

  if (close) {
    return do_close();
  }
  parser_.reset();
  do_read_header();
}

void HttpSession::do_close() {
  beast::error_code ec;
  stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
  if (ec && ec != boost::asio::error::not_connected) {
    BOOST_LOG_TRIVIAL(debug) << "Session: Shutdown error: " << ec.message();
  }
}

} // namespace server
} // namespace pcloud
