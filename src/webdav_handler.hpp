#pragma once
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include "log.hpp"

namespace beast = boost::beast;
namespace http = beast::http;

using DavRequestHeader = http::request_header<>;
using StringResponse = http::response<http::string_body>;

using CredentialVerifier = std::function<bool(const std::string& user, const std::string& password)>;

struct AuthSettings {
  bool enabled = false;
  std::string username;
  CredentialVerifier verifier;
  std::string realm = "LanShare";
};

// A handler's answer. Small bodies travel in `message`; file bodies are
// streamed by the connection from `file`.
struct DavResponse {
  StringResponse message;
  std::optional<std::filesystem::path> file;
  uint64_t file_offset = 0;
  uint64_t file_length = 0;
  uint64_t file_size = 0;
  // HEAD: headers describe the body but none is sent.
  bool omit_body = false;

  int status() const { return static_cast<int>(message.result_int()); }
  bool partial() const { return file && (file_offset != 0 || file_length != file_size); }
};

// A single "bytes=" range resolved against a resource size.
struct ByteRange {
  bool present = false;      // a usable single range was requested
  bool satisfiable = false;
  uint64_t first = 0;
  uint64_t last = 0;         // inclusive
};

ByteRange parse_range(const std::string& header_value, uint64_t resource_size);

// RFC 1123 date, e.g. "Sun, 06 Nov 1994 08:49:37 GMT".
std::string http_date(std::time_t when);
std::string http_date(std::filesystem::file_time_type when);

// Returns the accepted user name, or nullopt when the Basic credentials are
// missing, malformed, or rejected by the verifier.
std::optional<std::string> check_basic_auth(const DavRequestHeader& request, const AuthSettings& auth);

DavResponse make_text_response(http::status status, const std::string& text);
DavResponse make_unauthorized(const std::string& realm);

std::string media_type_for(const std::filesystem::path& path);

// Where a PUT body is written before it replaces the target.
struct UploadTarget {
  std::filesystem::path destination;
  std::filesystem::path temp;
  bool existed = false;
};

// Maps requests onto a folder as a WebDAV collection. Stateless apart from
// the root; safe to share between connections.
class WebDavHandler {
public:
  explicit WebDavHandler(std::filesystem::path root, std::shared_ptr<Logger> logger = nullptr);

  // Every method except the body of a PUT.
  DavResponse handle(const DavRequestHeader& request) const;

  // Checks a PUT target. On success fills `upload` and returns nullopt;
  // otherwise returns the refusal to send.
  std::optional<DavResponse> prepare_upload(const DavRequestHeader& request, UploadTarget& upload) const;
  // Moves the received temp file into place.
  DavResponse complete_upload(const UploadTarget& upload) const;
  void abort_upload(const UploadTarget& upload) const;

  // Decoded URL path -> file inside the root; nullopt when it escapes.
  std::optional<std::filesystem::path> resolve(const std::string& url_path) const;

  const std::filesystem::path& root() const { return root_; }

  // "/a%20b/?x=1" -> "/a b/"
  static std::string request_path(const DavRequestHeader& request);

private:
  DavResponse handle_options() const;
  DavResponse handle_propfind(const DavRequestHeader& request, const std::filesystem::path& target) const;
  DavResponse handle_get(const DavRequestHeader& request, const std::filesystem::path& target, bool head) const;
  DavResponse handle_mkcol(const std::filesystem::path& target) const;
  DavResponse handle_delete(const std::filesystem::path& target) const;
  DavResponse directory_index(const std::string& url_path, const std::filesystem::path& dir, bool head) const;

  std::string href_for(const std::filesystem::path& target, bool is_directory) const;
  std::string propfind_response(const std::filesystem::path& target) const;

  std::filesystem::path root_;
  std::shared_ptr<Logger> logger_;
};
