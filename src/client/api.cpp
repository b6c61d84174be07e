#include "client/api.hpp"
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/log/trivial.hpp>
#include "protocol/constants.hpp"
#include "protocol/protocol_error.hpp"

namespace pcloud {
namespace client {

namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

namespace {

constexpr const char* USER_AGENT = "pcloud";

template <class Body>
void set_request_fields(http::request<Body>& request, const protocol::SignedRequest& signed_request,
                        const config::Endpoint& server) {
  const auto fields = protocol::to_fields(signed_request);
  request.set(http::field::host, server.host + ":" + std::to_string(server.port));
  request.set(http::field::user_agent, USER_AGENT);
  request.set(protocol::PARAM_FILENAME, fields.filename);
  request.set(protocol::PARAM_PUBKEY, fields.pubkey);
  request.set(protocol::PARAM_TIME, fields.time);
  request.set(protocol::PARAM_REQUEST_SIGNATURE, fields.request_signature);
  request.keep_alive(false);
}

void connect(beast::tcp_stream& stream, const config::Endpoint& server) {
  tcp::resolver resolver(stream.get_executor());
  auto endpoints = resolver.resolve(server.host, std::to_string(server.port));
  stream.connect(endpoints);
}

void close(beast::tcp_stream& stream) {
  beast::error_code ec;
  stream.socket().shutdown(tcp::socket::shutdown_both, ec);
}

} // namespace

HttpClient::HttpClient(config::Endpoint server) : server_(std::move(server)) {}


//==============================================
// PUSH
//==============================================

void HttpClient::push(const protocol::SignedRequest& request, const crypto::Signature& file_signature,
                      beast::file file) {
  try {
    boost::asio::io_context ioc;
    beast::tcp_stream stream(ioc);
    connect(stream, server_);

    http::request<http::file_body> req{http::verb::post, protocol::METHOD_UPLOAD, 11};
    set_request_fields(req, request, server_);
    req.set(protocol::PARAM_FILE_SIGNATURE, protocol::encode_signature(file_signature));
    req.set(http::field::content_type, "application/octet-stream");

    beast::error_code ec;
    req.body().reset(std::move(file), ec);
    if (ec) {
      throw protocol::IoError("Failed to attach file: " + ec.message());
    }
    req.prepare_payload();

    BOOST_LOG_TRIVIAL(debug) << "HTTP client: Uploading " << request.filename() << " to "
                             << server_.host << ":" << server_.port;
    // The server may answer and close before the whole body is sent; its answer
    // is still the more useful error
    beast::error_code write_ec;
    http::write(stream, req, write_ec);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    beast::error_code read_ec;
    http::read(stream, buffer, res, read_ec);
    close(stream);
    if (read_ec) {
      throw protocol::TransportError(write_ec ? write_ec.message() : read_ec.message());
    }

    if (res.result() != http::status::ok) {
      throw protocol::TransportError(res.result_int(), res.body());
    }
  } catch (const boost::system::system_error& e) {
    BOOST_LOG_TRIVIAL(error) << "HTTP client: Push failed: " << e.what();
    throw protocol::TransportError(e.what());
  }
}


//==============================================
// PULL
//==============================================

crypto::Signature HttpClient::pull(const protocol::SignedRequest& request,
                                   const std::filesystem::path& destination) {
  try {
    boost::asio::io_context ioc;
    beast::tcp_stream stream(ioc);
    connect(stream, server_);

    http::request<http::empty_body> req{http::verb::get, protocol::METHOD_DOWNLOAD, 11};
    set_request_fields(req, request, server_);

    BOOST_LOG_TRIVIAL(debug) << "HTTP client: Downloading " << request.filename() << " from "
                             << server_.host << ":" << server_.port;
    http::write(stream, req);

    beast::flat_buffer buffer;
    http::response_parser<http::empty_body> header_parser;
    header_parser.body_limit(boost::none);
    http::read_header(stream, buffer, header_parser);

    if (header_parser.get().result() != http::status::ok) {
      http::response_parser<http::string_body> error_parser{std::move(header_parser)};
      http::read(stream, buffer, error_parser);
      close(stream);
      throw protocol::TransportError(error_parser.get().result_int(), error_parser.get().body());
    }

    const auto& header = header_parser.get();
    auto it = header.find(protocol::PARAM_FILE_SIGNATURE);
    if (it == header.end()) {
      throw protocol::MalformedInputError(std::string("Header not found: ") + protocol::PARAM_FILE_SIGNATURE);
    }
    const auto file_signature = protocol::decode_signature(std::string(it->value().data(), it->value().size()));

    http::response_parser<http::file_body> body_parser{std::move(header_parser)};
    body_parser.body_limit(boost::none);
    beast::error_code ec;
    body_parser.get().body().open(destination.c_str(), beast::file_mode::write, ec);
    if (ec) {
      throw protocol::IoError("Failed to open " + destination.string() + ": " + ec.message());
    }
    http::read(stream, buffer, body_parser);
    body_parser.get().body().close();
    close(stream);

    return file_signature;
  } catch (const boost::system::system_error& e) {
    BOOST_LOG_TRIVIAL(error) << "HTTP client: Pull failed: " << e.what();
    throw protocol::TransportError(e.what());
  }
}

} // namespace client
} // namespace pcloud
