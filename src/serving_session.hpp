#pragma once
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "http_connection.hpp"
#include "log.hpp"
#include "webdav_handler.hpp"

struct ServiceConfig {
  std::filesystem::path shared_folder;
  uint16_t port = 8080;          // 0 picks an ephemeral port
  std::string bind_ip = "0.0.0.0";
  bool auth_enabled = false;
  std::string username;
  CredentialVerifier credential_verifier;
  std::size_t worker_threads = 8;
  std::string realm = "LanShare";
  std::size_t chunk_size = 256 * 1024;
};

// Serves a folder over HTTP/WebDAV on a pool of io threads.
class ServingSession {
public:
  explicit ServingSession(ServiceConfig config, std::shared_ptr<Logger> logger = nullptr);
  ~ServingSession();

  ServingSession(const ServingSession&) = delete;
  ServingSession& operator=(const ServingSession&) = delete;

  // Throws ServeError when the folder is unusable or the port cannot be bound.
  void start();
  // Closes the listener and every open connection, then joins the workers.
  void stop();
  bool running() const;

  uint16_t bound_port() const;
  std::vector<std::string> local_urls() const;

  void set_auth(bool enabled, const std::string& username, CredentialVerifier verifier);
  bool auth_enabled() const;
  std::size_t active_connections() const;

  const ServiceConfig& config() const { return config_; }

private:
  using tcp = net::ip::tcp;

  void do_accept();
  std::shared_ptr<const AuthSettings> current_auth() const;

  ServiceConfig config_;
  std::shared_ptr<Logger> logger_;

  mutable std::mutex lifecycle_mutex_;
  bool running_ = false;
  uint16_t bound_port_ = 0;
  std::unique_ptr<net::io_context> io_;
  std::unique_ptr<tcp::acceptor> acceptor_;
  std::vector<std::thread> workers_;
  std::shared_ptr<const WebDavHandler> handler_;

  mutable std::mutex auth_mutex_;
  std::shared_ptr<const AuthSettings> auth_;

  mutable std::mutex connections_mutex_;
  std::vector<std::weak_ptr<HttpConnection>> connections_;
};
