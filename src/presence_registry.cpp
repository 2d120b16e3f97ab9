#include "presence_registry.hpp"
#include "utils.hpp"

PresenceRegistry::PresenceRegistry(std::shared_ptr<Logger> logger)
  : logger_(std::move(logger))
{
}

void PresenceRegistry::set_change_callback(ChangeCallback cb){
  std::lock_guard lock(callback_mutex_);
  change_callback_ = std::move(cb);
}

void PresenceRegistry::on_peer_added(const std::string& service_id,
                                     const std::string& display_name,
                                     const asio::ip::address& address,
                                     uint16_t port)
{
  upsert(service_id, display_name, address, port);
}

void PresenceRegistry::on_peer_updated(const std::string& service_id,
                                       const std::string& display_name,
                                       const asio::ip::address& address,
                                       uint16_t port)
{
  upsert(service_id, display_name, address, port);
}

void PresenceRegistry::upsert(const std::string& service_id,
                              const std::string& display_name,
                              const asio::ip::address& address,
                              uint16_t port)
{
  if(service_id.empty()) return;

  std::optional<Change> change;
  PeerRecord record;
  {
    std::lock_guard lg(m_);
    auto now = std::chrono::system_clock::now();
    auto it = peers_.find(service_id);
    if(it == peers_.end()){
      PeerRecord pr;
      pr.service_id = service_id;
      pr.display_name = display_name;
      pr.address = address;
      pr.port = port;
      pr.last_seen = now;
      it = peers_.emplace(service_id, pr).first;
      change = Change::Added;
      log_info(logger_.get(), "Discovered peer {} at {}:{}", service_id, address.to_string(), port);
    } else if(it->second.address != address || it->second.port != port ||
              it->second.display_name != display_name){
      it->second.display_name = display_name;
      it->second.address = address;
      it->second.port = port;
      it->second.last_seen = now;
      change = Change::Updated;
      log_info(logger_.get(), "Updated peer {} -> {}:{}", service_id, address.to_string(), port);
    } else {
      it->second.last_seen = now;
    }
    record = it->second;
  }

  if(change) notify(*change, record);
}

void PresenceRegistry::on_peer_removed(const std::string& service_id){
  PeerRecord removed;
  {
    std::lock_guard lg(m_);
    auto it = peers_.find(service_id);
    if(it == peers_.end()) return;
    removed = it->second;
    peers_.erase(it);
  }
  log_info(logger_.get(), "Peer removed: {}", service_id);
  notify(Change::Removed, removed);
}

std::map<std::string, PeerRecord> PresenceRegistry::snapshot() const{
  std::lock_guard lg(m_);
  return peers_;
}

std::optional<PeerRecord> PresenceRegistry::find(const std::string& name) const{
  std::lock_guard lg(m_);
  auto it = peers_.find(name);
  if(it != peers_.end()) return it->second;
  auto wanted = to_lower(name);
  for(const auto& kv : peers_){
    if(to_lower(kv.second.display_name) == wanted || to_lower(kv.first) == wanted){
      return kv.second;
    }
  }
  return std::nullopt;
}

std::size_t PresenceRegistry::size() const{
  std::lock_guard lg(m_);
  return peers_.size();
}

void PresenceRegistry::clear(){
  std::map<std::string, PeerRecord> dropped;
  {
    std::lock_guard lg(m_);
    dropped.swap(peers_);
  }
  for(const auto& kv : dropped){
    notify(Change::Removed, kv.second);
  }
}

void PresenceRegistry::notify(Change change, const PeerRecord& record){
  ChangeCallback cb;
  {
    std::lock_guard lock(callback_mutex_);
    cb = change_callback_;
  }
  if(cb) cb(change, record);
}
