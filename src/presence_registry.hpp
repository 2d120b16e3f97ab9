#pragma once
#include <asio.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "log.hpp"

struct PeerRecord {
  std::string service_id;      // "<prefix>-<host>", unique per advertisement
  std::string display_name;    // service_id without the app prefix
  asio::ip::address address;
  uint16_t port = 0;
  std::chrono::system_clock::time_point last_seen;

  std::string base_url() const {
    std::string host = address.is_v6() ? "[" + address.to_string() + "]" : address.to_string();
    return "http://" + host + ":" + std::to_string(port);
  }
};

// Peers currently visible on the network, keyed by service id. The discovery
// worker writes; any thread may read through snapshot().
class PresenceRegistry {
public:
  enum class Change { Added, Updated, Removed };
  using ChangeCallback = std::function<void(Change, const PeerRecord&)>;

  explicit PresenceRegistry(std::shared_ptr<Logger> logger = nullptr);

  // Single consumer; replaces any previous one.
  void set_change_callback(ChangeCallback cb);

  // Insert or replace. Identical id + address + port only refreshes last_seen.
  void on_peer_added(const std::string& service_id,
                     const std::string& display_name,
                     const asio::ip::address& address,
                     uint16_t port);
  void on_peer_updated(const std::string& service_id,
                       const std::string& display_name,
                       const asio::ip::address& address,
                       uint16_t port);
  void on_peer_removed(const std::string& service_id);

  std::map<std::string, PeerRecord> snapshot() const;

  // Matches a service id first, then a display name (case-insensitive).
  std::optional<PeerRecord> find(const std::string& name) const;

  std::size_t size() const;
  void clear();

private:
  void upsert(const std::string& service_id,
              const std::string& display_name,
              const asio::ip::address& address,
              uint16_t port);
  void notify(Change change, const PeerRecord& record);

  mutable std::mutex m_;
  std::map<std::string, PeerRecord> peers_;

  mutable std::mutex callback_mutex_;
  ChangeCallback change_callback_;
  std::shared_ptr<Logger> logger_;
};
