#pragma once
#include <asio.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>

// One DNS-SD service instance, as advertised or as resolved from the network.
struct ServiceAdvertisement {
  std::string instance_name;  // "LanShare-box"
  std::string service_type;   // "_webdav._tcp.local."
  std::string host_name;      // "box.local."
  asio::ip::address_v4 address;
  uint16_t port = 0;
  std::map<std::string, std::string> properties;

  // "LanShare-box._webdav._tcp.local."
  std::string full_name() const {
    std::string type = service_type;
    if(!type.empty() && type.back() != '.') type.push_back('.');
    return instance_name + "." + type;
  }
};

struct BrowseHandlers {
  std::function<void(const ServiceAdvertisement&)> added;
  std::function<void(const ServiceAdvertisement&)> updated;
  std::function<void(const std::string& full_name)> removed;
  // A live instance was re-advertised without changes.
  std::function<void(const ServiceAdvertisement&)> refreshed;
};

using BrowseHandle = std::size_t;

// Seam between the discovery session and the multicast transport. The
// production implementation is MdnsResponder; tests drive an in-memory stack.
class MulticastStack {
public:
  virtual ~MulticastStack() = default;

  // Throws std::system_error when the multicast socket cannot be set up.
  virtual void open() = 0;
  virtual void register_service(const ServiceAdvertisement& service) = 0;
  // Sends goodbye records for a registered instance.
  virtual void unregister_service(const ServiceAdvertisement& service) = 0;

  // Every live instance of `service_type` is replayed to `added` before new
  // network events are delivered.
  virtual BrowseHandle add_listener(const std::string& service_type, BrowseHandlers handlers) = 0;
  virtual void remove_listener(BrowseHandle handle) = 0;

  virtual void close() = 0;
};
