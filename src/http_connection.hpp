#pragma once
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <fstream>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "log.hpp"
#include "webdav_handler.hpp"

namespace net = boost::asio;

// One accepted HTTP/1.1 connection. All handlers run on the socket's strand;
// only one read or write is outstanding at a time.
class HttpConnection : public std::enable_shared_from_this<HttpConnection> {
public:
  using AuthProvider = std::function<std::shared_ptr<const AuthSettings>()>;

  static std::shared_ptr<HttpConnection> create(net::ip::tcp::socket sock,
                                                std::shared_ptr<const WebDavHandler> handler,
                                                AuthProvider auth,
                                                std::size_t chunk_size,
                                                std::shared_ptr<Logger> logger);

  ~HttpConnection();

  void start();
  // Safe from any thread.
  void close();
  // Only when no io thread is running.
  void close_now();

  const std::string& remote() const { return remote_; }

private:
  using RangeResponse = http::response<http::buffer_body>;
  using RangeSerializer = http::response_serializer<http::buffer_body>;

  HttpConnection(net::ip::tcp::socket sock,
                 std::shared_ptr<const WebDavHandler> handler,
                 AuthProvider auth,
                 std::size_t chunk_size,
                 std::shared_ptr<Logger> logger);

  void do_read_header();
  void on_header(beast::error_code ec);
  void reply_after_body(DavResponse reply, bool keep_alive);
  void read_request_body(bool keep_alive, std::optional<DavResponse> reply);
  void read_upload(bool keep_alive);
  bool read_failed(beast::error_code ec, const char* what);
  std::optional<DavResponse> check_auth(const DavRequestHeader& request);
  DavResponse handle(const DavRequestHeader& request);

  void write_response(DavResponse response, bool keep_alive);
  void write_file(DavResponse response, bool keep_alive);
  void write_range(DavResponse response, bool keep_alive);
  void pump_range(std::shared_ptr<RangeResponse> res,
                  std::shared_ptr<RangeSerializer> serializer,
                  std::shared_ptr<std::ifstream> file,
                  uint64_t remaining,
                  bool keep_alive);
  void finish_response(bool keep_alive);
  void send_error_and_close(http::status status, const std::string& text);

  beast::tcp_stream stream_;
  std::shared_ptr<const WebDavHandler> handler_;
  AuthProvider auth_;
  std::size_t chunk_size_;
  std::shared_ptr<Logger> logger_;
  beast::flat_buffer buffer_;
  std::optional<http::request_parser<http::empty_body>> header_parser_;
  std::optional<http::request_parser<http::string_body>> body_parser_;
  std::optional<http::request_parser<http::file_body>> upload_parser_;
  std::vector<char> chunk_;
  std::string remote_;
  std::optional<std::string> authenticated_user_;
};
