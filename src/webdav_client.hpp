#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "log.hpp"
#include "multistatus_parser.hpp"

struct Credentials {
  std::string username;
  std::string password;
};

struct ListingResult {
  int status = 0;              // 0 when no response arrived
  std::string error;
  std::vector<DirectoryEntry> entries;
};

struct FetchCallbacks {
  // Called once the server answered 2xx, before the first chunk.
  std::function<void(uint64_t total_bytes)> on_start;
  // Return false to stop the transfer.
  std::function<bool(const char* data, std::size_t size)> on_chunk;
};

struct FetchResult {
  int status = 0;
  std::string error;
  uint64_t bytes = 0;
  bool stopped = false;        // on_chunk asked to stop
};

// The listing and download capability the transfer engine runs against.
class RemoteShare {
public:
  virtual ~RemoteShare() = default;

  // PROPFIND Depth 1. A malformed 207 body throws ListingError.
  virtual ListingResult list_directory(const std::string& remote_path,
                                       const std::optional<Credentials>& credentials) = 0;

  virtual FetchResult fetch_file(const std::string& remote_path,
                                 const std::optional<Credentials>& credentials,
                                 const FetchCallbacks& callbacks,
                                 std::size_t chunk_size) = 0;
};

// Blocking HTTP/1.1 WebDAV client on Beast, one connection per request.
class WebDavClient : public RemoteShare {
public:
  WebDavClient(std::string host, uint16_t port, std::shared_ptr<Logger> logger = nullptr);

  ListingResult list_directory(const std::string& remote_path,
                               const std::optional<Credentials>& credentials) override;

  FetchResult fetch_file(const std::string& remote_path,
                         const std::optional<Credentials>& credentials,
                         const FetchCallbacks& callbacks,
                         std::size_t chunk_size) override;

  // Inactivity limits per network operation.
  void set_timeouts(std::chrono::milliseconds listing, std::chrono::milliseconds fetch);

  const std::string& host() const { return host_; }
  uint16_t port() const { return port_; }

private:
  std::vector<std::pair<std::string, std::string>> base_headers(const std::optional<Credentials>& credentials) const;

  std::string host_;
  uint16_t port_;
  std::shared_ptr<Logger> logger_;
  std::chrono::milliseconds listing_timeout_{10000};
  std::chrono::milliseconds fetch_timeout_{60000};
};

std::string propfind_request_body();
