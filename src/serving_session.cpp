#include "serving_session.hpp"
#include "local_address.hpp"
#include "share_errors.hpp"

#include <algorithm>

namespace fs = std::filesystem;

ServingSession::ServingSession(ServiceConfig config, std::shared_ptr<Logger> logger)
  : config_(std::move(config)),
    logger_(std::move(logger))
{
  set_auth(config_.auth_enabled, config_.username, config_.credential_verifier);
}

ServingSession::~ServingSession(){
  stop();
}

void ServingSession::set_auth(bool enabled, const std::string& username, CredentialVerifier verifier){
  auto settings = std::make_shared<AuthSettings>();
  settings->enabled = enabled;
  settings->username = username;
  settings->verifier = std::move(verifier);
  settings->realm = config_.realm;
  {
    std::lock_guard lock(auth_mutex_);
    auth_ = std::move(settings);
  }
  log_info(logger_.get(), "WebDAV authentication {}", enabled ? "enabled" : "disabled");
}

std::shared_ptr<const AuthSettings> ServingSession::current_auth() const {
  std::lock_guard lock(auth_mutex_);
  return auth_;
}

bool ServingSession::auth_enabled() const {
  auto auth = current_auth();
  return auth && auth->enabled;
}

void ServingSession::start(){
  std::lock_guard lock(lifecycle_mutex_);
  if(running_) return;

  std::error_code ec;
  if(config_.shared_folder.empty() || !fs::is_directory(config_.shared_folder, ec)) {
    throw ServeError("Shared folder is not a directory: " + config_.shared_folder.string());
  }
  auto auth = current_auth();
  if(auth->enabled && !auth->verifier) {
    throw ServeError("Authentication enabled without a credential verifier");
  }

  beast::error_code address_ec;
  auto bind_address = net::ip::make_address(config_.bind_ip, address_ec);
  if(address_ec) {
    throw ServeError("Invalid bind address '" + config_.bind_ip + "': " + address_ec.message());
  }

  auto io = std::make_unique<net::io_context>();
  auto acceptor = std::make_unique<tcp::acceptor>(*io);
  try {
    tcp::endpoint endpoint(bind_address, config_.port);
    acceptor->open(endpoint.protocol());
    acceptor->set_option(tcp::acceptor::reuse_address(true));
    acceptor->bind(endpoint);
    acceptor->listen(net::socket_base::max_listen_connections);
  } catch(const boost::system::system_error& e) {
    log_error(logger_.get(), "Unable to bind {}:{}: {}", config_.bind_ip, config_.port, e.what());
    throw ServeError("Port " + std::to_string(config_.port) + " is unavailable: " + e.what());
  }

  handler_ = std::make_shared<const WebDavHandler>(config_.shared_folder, logger_);
  io_ = std::move(io);
  acceptor_ = std::move(acceptor);
  bound_port_ = acceptor_->local_endpoint().port();
  running_ = true;

  do_accept();

  auto threads = std::max<std::size_t>(1, config_.worker_threads);
  workers_.reserve(threads);
  for(std::size_t i = 0; i < threads; ++i) {
    workers_.emplace_back([this](){
      try {
        io_->run();
      } catch(const std::exception& e) {
        log_error(logger_.get(), "Serving worker terminated: {}", e.what());
      }
    });
  }
  log_info(logger_.get(), "Serving {} on {}:{} ({} threads)",
           handler_->root().string(), config_.bind_ip, bound_port_, threads);
}

void ServingSession::do_accept(){
  acceptor_->async_accept(net::make_strand(*io_),
    [this](beast::error_code ec, tcp::socket socket){
      if(ec) {
        if(ec == net::error::operation_aborted) return;
        log_warn(logger_.get(), "Accept error: {}", ec.message());
      } else {
        auto conn = HttpConnection::create(std::move(socket),
                                           handler_,
                                           [this](){ return current_auth(); },
                                           config_.chunk_size,
                                           logger_);
        {
          std::lock_guard lock(connections_mutex_);
          connections_.erase(std::remove_if(connections_.begin(), connections_.end(),
                                            [](const std::weak_ptr<HttpConnection>& w){ return w.expired(); }),
                             connections_.end());
          connections_.push_back(conn);
        }
        conn->start();
      }
      if(acceptor_ && acceptor_->is_open()) do_accept();
    });
}

void ServingSession::stop(){
  std::lock_guard lock(lifecycle_mutex_);
  if(!running_) return;
  running_ = false;

  // No handler runs once the workers are joined, so the sockets can be closed
  // from here without racing a strand.
  io_->stop();
  for(auto& worker : workers_) {
    if(worker.joinable()) worker.join();
  }
  workers_.clear();

  beast::error_code ec;
  acceptor_->close(ec);
  std::vector<std::weak_ptr<HttpConnection>> open;
  {
    std::lock_guard conn_lock(connections_mutex_);
    open.swap(connections_);
  }
  std::size_t closed = 0;
  for(auto& weak : open) {
    if(auto conn = weak.lock()) {
      conn->close_now();
      ++closed;
    }
  }
  open.clear();

  acceptor_.reset();
  // Destroys pending handlers and with them the remaining connections.
  io_.reset();
  handler_.reset();
  log_info(logger_.get(), "Serving stopped ({} connections closed)", closed);
}

bool ServingSession::running() const {
  std::lock_guard lock(lifecycle_mutex_);
  return running_;
}

uint16_t ServingSession::bound_port() const {
  std::lock_guard lock(lifecycle_mutex_);
  return bound_port_;
}

std::size_t ServingSession::active_connections() const {
  std::lock_guard lock(connections_mutex_);
  return static_cast<std::size_t>(std::count_if(connections_.begin(), connections_.end(),
    [](const std::weak_ptr<HttpConnection>& w){ return !w.expired(); }));
}

std::vector<std::string> ServingSession::local_urls() const {
  auto port = bound_port();
  if(port == 0) port = config_.port;
  std::vector<std::string> urls;
  beast::error_code ec;
  auto bind_address = net::ip::make_address(config_.bind_ip, ec);
  if(!ec && !bind_address.is_unspecified()) {
    urls.push_back("http://" + bind_address.to_string() + ":" + std::to_string(port) + "/");
    return urls;
  }
  for(const auto& address : interface_addresses()) {
    urls.push_back("http://" + address.to_string() + ":" + std::to_string(port) + "/");
  }
  if(urls.empty()) {
    urls.push_back("http://localhost:" + std::to_string(port) + "/");
  }
  return urls;
}
