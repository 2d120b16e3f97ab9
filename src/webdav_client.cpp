#include "webdav_client.hpp"
#include "utils.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

namespace {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

constexpr uint64_t kMaxListingBytes = 16 * 1024 * 1024;

// One request/response exchange on a private io_context. Every operation is
// bounded by the inactivity timeout; errors are thrown as system_error.
class HttpExchange {
public:
  explicit HttpExchange(std::chrono::milliseconds timeout)
    : stream_(io_), timeout_(timeout) {}

  ~HttpExchange(){
    beast::error_code ignored;
    stream_.socket().shutdown(tcp::socket::shutdown_both, ignored);
    stream_.close();
  }

  void connect(const std::string& host, uint16_t port){
    tcp::resolver resolver(io_);
    beast::error_code ec;
    auto endpoints = resolver.resolve(host, std::to_string(port), ec);
    check(ec, "resolve " + host);

    stream_.expires_after(timeout_);
    stream_.async_connect(endpoints,
      [&](beast::error_code e, const tcp::endpoint&){ ec = e; });
    run();
    check(ec, "connect " + host + ":" + std::to_string(port));
  }

  void send(const http::request<http::string_body>& request){
    beast::error_code ec;
    stream_.expires_after(timeout_);
    http::async_write(stream_, request,
      [&](beast::error_code e, std::size_t){ ec = e; });
    run();
    check(ec, "write request");
  }

  template<class Parser>
  void read_header(Parser& parser){
    beast::error_code ec;
    stream_.expires_after(timeout_);
    http::async_read_header(stream_, buffer_, parser,
      [&](beast::error_code e, std::size_t){ ec = e; });
    run();
    check(ec, "read response head");
  }

  template<class Parser>
  void read_all(Parser& parser){
    beast::error_code ec;
    stream_.expires_after(timeout_);
    http::async_read(stream_, buffer_, parser,
      [&](beast::error_code e, std::size_t){ ec = e; });
    run();
    check(ec, "read response body");
  }

  // Fills the parser's buffer_body once; need_buffer is not an error.
  void read_some(http::response_parser<http::buffer_body>& parser){
    beast::error_code ec;
    stream_.expires_after(timeout_);
    http::async_read_some(stream_, buffer_, parser,
      [&](beast::error_code e, std::size_t){ ec = e; });
    run();
    if(ec == http::error::need_buffer) ec = {};
    check(ec, "read response body");
  }

private:
  void run(){
    io_.restart();
    io_.run();
  }

  static void check(const beast::error_code& ec, const std::string& what){
    if(ec) throw boost::system::system_error(ec, what);
  }

  net::io_context io_;
  beast::tcp_stream stream_;
  beast::flat_buffer buffer_;
  std::chrono::milliseconds timeout_;
};

template<class Parser>
std::string status_text(const Parser& parser){
  const auto& res = parser.get();
  auto reason = std::string(res.reason());
  if(reason.empty()) reason = std::string(http::obsolete_reason(res.result()));
  return "HTTP " + std::to_string(res.result_int()) + " " + reason;
}

} // namespace

std::string propfind_request_body(){
  return "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
         "<D:propfind xmlns:D=\"DAV:\"><D:prop>"
         "<D:displayname/><D:getcontentlength/><D:getlastmodified/>"
         "<D:resourcetype/><D:getcontenttype/>"
         "</D:prop></D:propfind>\n";
}

WebDavClient::WebDavClient(std::string host, uint16_t port, std::shared_ptr<Logger> logger)
  : host_(std::move(host)),
    port_(port),
    logger_(std::move(logger))
{}

void WebDavClient::set_timeouts(std::chrono::milliseconds listing, std::chrono::milliseconds fetch){
  listing_timeout_ = listing;
  fetch_timeout_ = fetch;
}

std::vector<std::pair<std::string, std::string>>
WebDavClient::base_headers(const std::optional<Credentials>& credentials) const {
  auto host = host_.find(':') != std::string::npos ? "[" + host_ + "]" : host_;
  std::vector<std::pair<std::string, std::string>> headers = {
    {"Host", host + ":" + std::to_string(port_)},
    {"User-Agent", "lanshare"},
    {"Accept", "*/*"},
  };
  if(credentials) {
    headers.emplace_back("Authorization",
                         "Basic " + base64_encode(credentials->username + ":" + credentials->password));
  }
  return headers;
}

ListingResult WebDavClient::list_directory(const std::string& remote_path,
                                           const std::optional<Credentials>& credentials)
{
  ListingResult result;
  auto normalized = normalize_remote_path(remote_path);
  auto target = "/" + url_encode_path(normalized);
  if(!normalized.empty()) target += "/";

  http::request<http::string_body> request{http::verb::propfind, target, 11};
  for(const auto& header : base_headers(credentials)) request.set(header.first, header.second);
  request.set("Depth", "1");
  request.set(http::field::content_type, "application/xml; charset=utf-8");
  request.keep_alive(false);
  request.body() = propfind_request_body();
  request.prepare_payload();

  std::string body;
  try {
    HttpExchange exchange(listing_timeout_);
    exchange.connect(host_, port_);
    exchange.send(request);
    http::response_parser<http::string_body> parser;
    parser.body_limit(kMaxListingBytes);
    exchange.read_header(parser);
    result.status = static_cast<int>(parser.get().result_int());
    if(result.status != 207) {
      result.error = status_text(parser);
      log_debug(logger_.get(), "PROPFIND {} -> {}", target, result.error);
      return result;
    }
    exchange.read_all(parser);
    body = parser.release().body();
  } catch(const boost::system::system_error& e) {
    result.error = e.what();
    log_debug(logger_.get(), "PROPFIND {} failed: {}", target, result.error);
    return result;
  }

  result.entries = parse_multistatus(body, normalized);
  log_debug(logger_.get(), "PROPFIND {} -> {} entries", target, result.entries.size());
  return result;
}

FetchResult WebDavClient::fetch_file(const std::string& remote_path,
                                     const std::optional<Credentials>& credentials,
                                     const FetchCallbacks& callbacks,
                                     std::size_t chunk_size)
{
  FetchResult result;
  auto target = "/" + url_encode_path(normalize_remote_path(remote_path));
  if(chunk_size == 0) chunk_size = 1024 * 1024;

  http::request<http::string_body> request{http::verb::get, target, 11};
  for(const auto& header : base_headers(credentials)) request.set(header.first, header.second);
  request.keep_alive(false);

  try {
    HttpExchange exchange(fetch_timeout_);
    exchange.connect(host_, port_);
    exchange.send(request);

    http::response_parser<http::buffer_body> parser;
    parser.body_limit(boost::none);
    exchange.read_header(parser);
    result.status = static_cast<int>(parser.get().result_int());
    if(result.status < 200 || result.status >= 300) {
      result.error = status_text(parser);
      log_debug(logger_.get(), "GET {} -> {}", target, result.error);
      return result;
    }

    auto length = parser.content_length();
    if(callbacks.on_start) callbacks.on_start(length ? *length : 0);

    std::vector<char> buffer(chunk_size);
    while(!parser.is_done()) {
      parser.get().body().data = buffer.data();
      parser.get().body().size = buffer.size();
      exchange.read_some(parser);
      auto n = buffer.size() - parser.get().body().size;
      if(n == 0) continue;
      result.bytes += n;
      if(callbacks.on_chunk && !callbacks.on_chunk(buffer.data(), n)) {
        result.stopped = true;
        break;
      }
    }
  } catch(const boost::system::system_error& e) {
    result.error = e.what();
  }
  if(!result.error.empty()) {
    log_debug(logger_.get(), "GET {} failed after {} bytes: {}", target, result.bytes, result.error);
  }
  return result;
}
