#include "discovery_session.hpp"
#include "share_errors.hpp"
#include "utils.hpp"

#include <algorithm>

DiscoverySession::DiscoverySession(std::shared_ptr<MulticastStack> stack,
                                   std::shared_ptr<PresenceRegistry> registry,
                                   DiscoveryOptions options,
                                   std::shared_ptr<Logger> logger)
  : stack_(std::move(stack)),
    registry_(std::move(registry)),
    options_(std::move(options)),
    logger_(std::move(logger))
{
}

DiscoverySession::~DiscoverySession(){
  stop();
}

std::string DiscoverySession::parse_service_id(const std::string& full_name){
  auto dot = full_name.find('.');
  return dot == std::string::npos ? full_name : full_name.substr(0, dot);
}

std::optional<std::string> DiscoverySession::display_name_for(const std::string& service_id) const {
  auto prefix = to_lower(options_.app_prefix) + "-";
  if(service_id.size() <= prefix.size()) return std::nullopt;
  if(to_lower(service_id.substr(0, prefix.size())) != prefix) return std::nullopt;
  return service_id.substr(prefix.size());
}

asio::ip::address_v4 DiscoverySession::choose_address() const {
  if(!options_.advertise_ip.empty()) {
    std::error_code ec;
    auto address = asio::ip::make_address_v4(options_.advertise_ip, ec);
    if(ec) {
      throw RegistrationError("Invalid advertise address '" + options_.advertise_ip + "': " + ec.message());
    }
    return address;
  }
  if(!options_.address_sources.empty()) {
    return resolve_local_address(options_.address_sources, logger_.get());
  }
  return resolve_local_address(logger_.get());
}

void DiscoverySession::start(){
  std::lock_guard lock(m_);
  if(started_) return;
  if(!stack_) throw RegistrationError("No multicast stack configured");

  if(options_.app_prefix.empty() || options_.app_prefix.find('.') != std::string::npos) {
    throw RegistrationError("Invalid service prefix '" + options_.app_prefix + "'");
  }
  auto address = choose_address();
  auto host_id = options_.host_id.empty() ? local_host_name() : options_.host_id;
  // a dot would end the instance label early
  std::replace(host_id.begin(), host_id.end(), '.', '-');
  if(host_id.empty()) throw RegistrationError("Empty host id");

  local_service_ = ServiceAdvertisement{};
  local_service_.instance_name = options_.app_prefix + "-" + host_id;
  local_service_.service_type = options_.service_type;
  local_service_.host_name = host_id + ".local.";
  local_service_.address = address;
  local_service_.port = options_.port;
  local_service_.properties = {
    {"path", "/"},
    {"version", options_.version},
    {"app", options_.app_prefix}
  };
  {
    std::lock_guard identity(identity_mutex_);
    self_key_ = to_lower(parse_service_id(local_service_.full_name()));
  }

  try {
    stack_->open();
    opened_ = true;
    stack_->register_service(local_service_);
    registered_ = true;
  } catch(const std::exception& e) {
    log_error(logger_.get(), "Failed to register {}: {}", local_service_.full_name(), e.what());
    release_locked();
    throw RegistrationError(std::string("mDNS registration failed: ") + e.what());
  }
  started_ = true;
  log_info(logger_.get(), "Advertising {} at {}:{}", local_service_.full_name(),
           address.to_string(), options_.port);

  try {
    listener_ = stack_->add_listener(options_.service_type, make_handlers());
    log_info(logger_.get(), "Browsing for {} services", options_.service_type);
  } catch(const std::exception& e) {
    log_error(logger_.get(), "Failed to start browsing for {}: {}", options_.service_type, e.what());
  }
}

void DiscoverySession::stop(){
  std::lock_guard lock(m_);
  if(!started_ && !opened_) return;
  release_locked();
  log_info(logger_.get(), "Discovery stopped");
}

void DiscoverySession::release_locked(){
  if(listener_) {
    try {
      stack_->remove_listener(*listener_);
    } catch(const std::exception& e) {
      log_warn(logger_.get(), "Removing service listener failed: {}", e.what());
    }
    listener_.reset();
  }
  if(registered_) {
    try {
      stack_->unregister_service(local_service_);
    } catch(const std::exception& e) {
      log_warn(logger_.get(), "Unregistering {} failed: {}", local_service_.full_name(), e.what());
    }
    registered_ = false;
  }
  if(opened_) {
    try {
      stack_->close();
    } catch(const std::exception& e) {
      log_warn(logger_.get(), "Closing multicast stack failed: {}", e.what());
    }
    opened_ = false;
  }
  started_ = false;
  std::lock_guard forwarded_lock(forwarded_mutex_);
  forwarded_.clear();
}

void DiscoverySession::trigger_rediscovery(){
  std::lock_guard lock(m_);
  if(!started_) {
    log_warn(logger_.get(), "Cannot rediscover peers: discovery is not running");
    return;
  }
  try {
    if(listener_) {
      stack_->remove_listener(*listener_);
      listener_.reset();
    }
    listener_ = stack_->add_listener(options_.service_type, make_handlers());
    log_info(logger_.get(), "Re-attached listener for {}", options_.service_type);
  } catch(const std::exception& e) {
    log_error(logger_.get(), "Peer rediscovery failed: {}", e.what());
  }
}

bool DiscoverySession::running() const {
  std::lock_guard lock(m_);
  return started_;
}

bool DiscoverySession::is_self(const std::string& service_id) const {
  std::lock_guard identity(identity_mutex_);
  return !self_key_.empty() && to_lower(service_id) == self_key_;
}

std::string DiscoverySession::local_service_id() const {
  std::lock_guard lock(m_);
  return local_service_.instance_name;
}

std::optional<ServiceAdvertisement> DiscoverySession::advertisement() const {
  std::lock_guard lock(m_);
  if(!started_) return std::nullopt;
  return local_service_;
}

BrowseHandlers DiscoverySession::make_handlers(){
  BrowseHandlers handlers;
  handlers.added = [this](const ServiceAdvertisement& s){ on_service_added(s); };
  handlers.updated = [this](const ServiceAdvertisement& s){ on_service_updated(s); };
  handlers.removed = [this](const std::string& name){ on_service_removed(name); };
  handlers.refreshed = [this](const ServiceAdvertisement& s){ on_service_refreshed(s); };
  return handlers;
}

void DiscoverySession::on_service_added(const ServiceAdvertisement& service){
  auto full_name = service.full_name();
  auto id = parse_service_id(full_name);
  if(is_self(id)) {
    log_debug(logger_.get(), "Ignoring own service {}", full_name);
    return;
  }
  auto display = display_name_for(id);
  if(!display) {
    log_debug(logger_.get(), "Ignoring foreign service {}", full_name);
    return;
  }
  if(service.address.is_unspecified() || service.port == 0) {
    log_warn(logger_.get(), "Ignoring {}: no usable address", full_name);
    return;
  }
  log_info(logger_.get(), "Service added: {}", full_name);
  {
    std::lock_guard lock(forwarded_mutex_);
    forwarded_.insert(id);
  }
  if(registry_) {
    registry_->on_peer_added(id, *display, asio::ip::address(service.address), service.port);
  }
}

void DiscoverySession::on_service_updated(const ServiceAdvertisement& service){
  log_info(logger_.get(), "Service updated: {}", service.full_name());
  on_service_removed(service.full_name());
  on_service_added(service);
}

void DiscoverySession::on_service_refreshed(const ServiceAdvertisement& service){
  auto id = parse_service_id(service.full_name());
  {
    std::lock_guard lock(forwarded_mutex_);
    if(forwarded_.count(id) == 0) return;
  }
  auto display = display_name_for(id);
  if(registry_ && display) {
    registry_->on_peer_updated(id, *display, asio::ip::address(service.address), service.port);
  }
}

void DiscoverySession::on_service_removed(const std::string& full_name){
  auto id = parse_service_id(full_name);
  {
    std::lock_guard lock(forwarded_mutex_);
    if(forwarded_.erase(id) == 0) return;
  }
  log_info(logger_.get(), "Service removed: {}", full_name);
  if(registry_) registry_->on_peer_removed(id);
}
