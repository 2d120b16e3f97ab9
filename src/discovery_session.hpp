#pragma once
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "local_address.hpp"
#include "log.hpp"
#include "multicast_stack.hpp"
#include "presence_registry.hpp"

struct DiscoveryOptions {
  std::string app_prefix = "LanShare";
  std::string host_id;        // empty: the machine's host name
  std::string service_type = "_webdav._tcp.local.";
  uint16_t port = 8080;
  std::string advertise_ip;   // empty: routed source, then interfaces, then 127.0.0.1
  std::string version = "1.0";
  // Replaces the default route/interface chain when non-empty.
  std::vector<AddressSource> address_sources;
};

// Advertises the local share over DNS-SD and feeds peer advertisements of the
// same service type into a PresenceRegistry.
class DiscoverySession {
public:
  DiscoverySession(std::shared_ptr<MulticastStack> stack,
                   std::shared_ptr<PresenceRegistry> registry,
                   DiscoveryOptions options,
                   std::shared_ptr<Logger> logger = nullptr);
  ~DiscoverySession();

  DiscoverySession(const DiscoverySession&) = delete;
  DiscoverySession& operator=(const DiscoverySession&) = delete;

  // Throws RegistrationError; on failure nothing stays acquired. Dots in the
  // host id become dashes.
  void start();
  void stop();
  void trigger_rediscovery();

  bool running() const;
  bool is_self(const std::string& service_id) const;
  std::string local_service_id() const;
  std::optional<ServiceAdvertisement> advertisement() const;

  // "LanShare-box._webdav._tcp.local." -> "LanShare-box"
  static std::string parse_service_id(const std::string& full_name);
  // "LanShare-box" -> "box"; nullopt when the id lacks "<prefix>-".
  std::optional<std::string> display_name_for(const std::string& service_id) const;

private:
  BrowseHandlers make_handlers();
  void release_locked();
  asio::ip::address_v4 choose_address() const;

  void on_service_added(const ServiceAdvertisement& service);
  void on_service_updated(const ServiceAdvertisement& service);
  void on_service_refreshed(const ServiceAdvertisement& service);
  void on_service_removed(const std::string& full_name);

  std::shared_ptr<MulticastStack> stack_;
  std::shared_ptr<PresenceRegistry> registry_;
  DiscoveryOptions options_;
  std::shared_ptr<Logger> logger_;

  mutable std::mutex m_;
  bool started_ = false;
  bool opened_ = false;
  bool registered_ = false;
  std::optional<BrowseHandle> listener_;
  ServiceAdvertisement local_service_;

  // Separate from m_: browse handlers run on the stack's thread while stop()
  // holds m_ and waits for that thread.
  mutable std::mutex identity_mutex_;
  std::string self_key_;   // lower-cased local service id

  // ids forwarded to the registry; written from the stack's thread
  std::mutex forwarded_mutex_;
  std::set<std::string> forwarded_;
};
