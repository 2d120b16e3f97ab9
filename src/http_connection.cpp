#include "http_connection.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>

namespace {

constexpr std::size_t kMaxHeadBytes = 64 * 1024;
constexpr std::size_t kMaxBodyBytes = 1024 * 1024;
constexpr std::chrono::seconds kIdleTimeout{120};

bool is_http_error(const beast::error_code& ec) {
  return ec.category() == beast::error_code(http::error::bad_method).category();
}

} // namespace

std::shared_ptr<HttpConnection> HttpConnection::create(net::ip::tcp::socket sock,
                                                       std::shared_ptr<const WebDavHandler> handler,
                                                       AuthProvider auth,
                                                       std::size_t chunk_size,
                                                       std::shared_ptr<Logger> logger)
{
  return std::shared_ptr<HttpConnection>(new HttpConnection(std::move(sock),
                                                            std::move(handler),
                                                            std::move(auth),
                                                            chunk_size,
                                                            std::move(logger)));
}

HttpConnection::HttpConnection(net::ip::tcp::socket sock,
                               std::shared_ptr<const WebDavHandler> handler,
                               AuthProvider auth,
                               std::size_t chunk_size,
                               std::shared_ptr<Logger> logger)
  : stream_(std::move(sock)),
    handler_(std::move(handler)),
    auth_(std::move(auth)),
    chunk_size_(chunk_size == 0 ? 256 * 1024 : chunk_size),
    logger_(std::move(logger))
{
  beast::error_code ec;
  auto ep = stream_.socket().remote_endpoint(ec);
  remote_ = ec ? std::string("unknown") : ep.address().to_string() + ":" + std::to_string(ep.port());
}

HttpConnection::~HttpConnection(){
  stream_.close();
}

void HttpConnection::start(){
  log_debug(logger_.get(), "Connection from {}", remote_);
  do_read_header();
}

void HttpConnection::close(){
  auto self = shared_from_this();
  net::post(stream_.get_executor(), [this, self](){
    close_now();
  });
}

void HttpConnection::close_now(){
  beast::error_code ec;
  stream_.socket().shutdown(net::ip::tcp::socket::shutdown_both, ec);
  stream_.close();
}

void HttpConnection::do_read_header(){
  header_parser_.emplace();
  header_parser_->header_limit(kMaxHeadBytes);
  stream_.expires_after(kIdleTimeout);

  auto self = shared_from_this();
  http::async_read_header(stream_, buffer_, *header_parser_,
    [this, self](beast::error_code ec, std::size_t){
      on_header(ec);
    });
}

bool HttpConnection::read_failed(beast::error_code ec, const char* what){
  if(!ec) return false;
  if(ec == http::error::end_of_stream || ec == net::error::operation_aborted) {
    close_now();
  } else if(ec == http::error::body_limit) {
    send_error_and_close(http::status::payload_too_large, "Request body too large");
  } else if(ec == http::error::header_limit) {
    send_error_and_close(http::status::request_header_fields_too_large, "Request header too large");
  } else if(is_http_error(ec)) {
    log_warn(logger_.get(), "Bad request from {}: {}", remote_, ec.message());
    send_error_and_close(http::status::bad_request, "Bad request");
  } else {
    log_debug(logger_.get(), "{} from {} failed: {}", what, remote_, ec.message());
  }
  return true;
}

void HttpConnection::on_header(beast::error_code ec){
  if(read_failed(ec, "Read")) return;

  const auto& request = header_parser_->get();
  const bool keep_alive = request.keep_alive();
  auto challenge = check_auth(request);
  if(challenge) {
    reply_after_body(std::move(*challenge), keep_alive);
    return;
  }

  if(request.method() == http::verb::put) {
    read_upload(keep_alive);
  } else {
    read_request_body(keep_alive, std::nullopt);
  }
}

void HttpConnection::reply_after_body(DavResponse reply, bool keep_alive){
  // Small bodies are drained so the reply is not lost to a reset; larger
  // ones end the connection.
  auto length = header_parser_->content_length();
  if(length && *length > kMaxBodyBytes) {
    write_response(std::move(reply), false);
    return;
  }
  read_request_body(keep_alive, std::move(reply));
}

void HttpConnection::read_request_body(bool keep_alive, std::optional<DavResponse> reply){
  body_parser_.emplace(std::move(*header_parser_));
  header_parser_.reset();
  body_parser_->body_limit(kMaxBodyBytes);

  auto self = shared_from_this();
  auto pending = std::make_shared<std::optional<DavResponse>>(std::move(reply));
  http::async_read(stream_, buffer_, *body_parser_,
    [this, self, keep_alive, pending](beast::error_code ec, std::size_t){
      if(read_failed(ec, "Body read")) return;
      auto request = body_parser_->release();
      body_parser_.reset();
      auto response = *pending ? std::move(**pending) : handle(request);
      log_debug(logger_.get(), "{} {} {} -> {}", remote_, std::string(request.method_string()),
                std::string(request.target()), response.status());
      write_response(std::move(response), keep_alive);
    });
}

void HttpConnection::read_upload(bool keep_alive){
  UploadTarget upload;
  auto refusal = handler_->prepare_upload(header_parser_->get(), upload);
  if(refusal) {
    reply_after_body(std::move(*refusal), keep_alive);
    return;
  }

  upload_parser_.emplace(std::move(*header_parser_));
  header_parser_.reset();
  upload_parser_->body_limit(boost::none);
  beast::error_code ec;
  upload_parser_->get().body().open(upload.temp.string().c_str(), beast::file_mode::write, ec);
  if(ec) {
    log_error(logger_.get(), "Unable to create {}: {}", upload.temp.string(), ec.message());
    upload_parser_.reset();
    send_error_and_close(http::status::internal_server_error, "Unable to store file");
    return;
  }

  // uploads may take longer than the idle limit
  stream_.expires_never();
  auto self = shared_from_this();
  http::async_read(stream_, buffer_, *upload_parser_,
    [this, self, upload, keep_alive](beast::error_code ec, std::size_t){
      upload_parser_->get().body().close();
      upload_parser_.reset();
      if(ec) {
        handler_->abort_upload(upload);
        read_failed(ec, "Upload");
        return;
      }
      write_response(handler_->complete_upload(upload), keep_alive);
    });
}

std::optional<DavResponse> HttpConnection::check_auth(const DavRequestHeader& request){
  auto auth = auth_ ? auth_() : nullptr;
  if(!auth || !auth->enabled || authenticated_user_) return std::nullopt;
  auto user = check_basic_auth(request, *auth);
  if(!user) {
    log_info(logger_.get(), "Authentication required for {} {} from {}",
             std::string(request.method_string()), WebDavHandler::request_path(request), remote_);
    return make_unauthorized(auth->realm);
  }
  authenticated_user_ = *user;
  return std::nullopt;
}

DavResponse HttpConnection::handle(const DavRequestHeader& request){
  try {
    return handler_->handle(request);
  } catch(const std::exception& e) {
    log_error(logger_.get(), "{} {} failed: {}", std::string(request.method_string()),
              std::string(request.target()), e.what());
    return make_text_response(http::status::internal_server_error, "Internal server error");
  }
}

void HttpConnection::write_response(DavResponse response, bool keep_alive){
  auto& message = response.message;
  message.version(11);
  message.set(http::field::server, "lanshare");
  message.set(http::field::date, http_date(std::time(nullptr)));

  if(response.file && !response.omit_body && response.file_length > 0) {
    if(response.partial()) {
      write_range(std::move(response), keep_alive);
    } else {
      write_file(std::move(response), keep_alive);
    }
    return;
  }

  auto res = std::make_shared<StringResponse>(std::move(message));
  if(response.file) {
    res->content_length(response.file_length);
  } else if(response.omit_body) {
    res->content_length(res->body().size());
    res->body().clear();
  } else {
    res->prepare_payload();
  }
  res->keep_alive(keep_alive);

  stream_.expires_after(kIdleTimeout);
  auto self = shared_from_this();
  http::async_write(stream_, *res,
    [this, self, res, keep_alive](beast::error_code ec, std::size_t){
      if(ec) {
        log_debug(logger_.get(), "Write to {} failed: {}", remote_, ec.message());
        return;
      }
      finish_response(keep_alive);
    });
}

void HttpConnection::write_file(DavResponse response, bool keep_alive){
  auto res = std::make_shared<http::response<http::file_body>>(std::move(response.message.base()));
  beast::error_code ec;
  res->body().open(response.file->string().c_str(), beast::file_mode::scan, ec);
  if(ec) {
    log_error(logger_.get(), "Unable to open {} for {}: {}", response.file->string(), remote_, ec.message());
    send_error_and_close(http::status::internal_server_error, "Unable to read file");
    return;
  }
  res->content_length(res->body().size());
  res->keep_alive(keep_alive);

  // a slow reader may take longer than the idle limit
  stream_.expires_never();
  auto self = shared_from_this();
  http::async_write(stream_, *res,
    [this, self, res, keep_alive](beast::error_code ec, std::size_t){
      if(ec) {
        log_debug(logger_.get(), "Streaming to {} aborted: {}", remote_, ec.message());
        return;
      }
      finish_response(keep_alive);
    });
}

void HttpConnection::write_range(DavResponse response, bool keep_alive){
  auto file = std::make_shared<std::ifstream>(*response.file, std::ios::binary);
  if(*file) file->seekg(static_cast<std::streamoff>(response.file_offset));
  if(!*file) {
    log_error(logger_.get(), "Unable to open {} for {}", response.file->string(), remote_);
    send_error_and_close(http::status::internal_server_error, "Unable to read file");
    return;
  }

  auto res = std::make_shared<RangeResponse>(std::move(response.message.base()));
  res->content_length(response.file_length);
  res->keep_alive(keep_alive);
  res->body().data = nullptr;
  res->body().more = true;
  auto serializer = std::make_shared<RangeSerializer>(*res);
  auto remaining = response.file_length;

  stream_.expires_never();
  auto self = shared_from_this();
  http::async_write_header(stream_, *serializer,
    [this, self, res, serializer, file, remaining, keep_alive](beast::error_code ec, std::size_t){
      if(ec) {
        log_debug(logger_.get(), "Write to {} failed: {}", remote_, ec.message());
        return;
      }
      pump_range(res, serializer, file, remaining, keep_alive);
    });
}

void HttpConnection::pump_range(std::shared_ptr<RangeResponse> res,
                                std::shared_ptr<RangeSerializer> serializer,
                                std::shared_ptr<std::ifstream> file,
                                uint64_t remaining,
                                bool keep_alive){
  auto want = static_cast<std::size_t>(std::min<uint64_t>(remaining, chunk_size_));
  chunk_.resize(want);
  file->read(chunk_.data(), static_cast<std::streamsize>(want));
  auto got = static_cast<std::size_t>(file->gcount());
  if(got == 0) {
    // the file shrank under us; the promised length can no longer be met
    log_warn(logger_.get(), "Short read while streaming to {}", remote_);
    close_now();
    return;
  }
  remaining -= got;
  res->body().data = chunk_.data();
  res->body().size = got;
  res->body().more = remaining > 0;

  auto self = shared_from_this();
  http::async_write(stream_, *serializer,
    [this, self, res, serializer, file, remaining, keep_alive](beast::error_code ec, std::size_t){
      if(ec == http::error::need_buffer) ec = {};
      if(ec) {
        log_debug(logger_.get(), "Streaming to {} aborted: {}", remote_, ec.message());
        return;
      }
      if(remaining == 0) {
        finish_response(keep_alive);
      } else {
        pump_range(res, serializer, file, remaining, keep_alive);
      }
    });
}

void HttpConnection::finish_response(bool keep_alive){
  if(keep_alive) {
    do_read_header();
  } else {
    close_now();
  }
}

void HttpConnection::send_error_and_close(http::status status, const std::string& text){
  write_response(make_text_response(status, text), false);
}
