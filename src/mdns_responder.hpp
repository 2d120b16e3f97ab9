#pragma once
#include <asio.hpp>
#include <array>
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include "dns_message.hpp"
#include "log.hpp"
#include "multicast_stack.hpp"

struct MdnsOptions {
  asio::ip::address_v4 group = asio::ip::make_address_v4("224.0.0.251");
  uint16_t port = 5353;
  // Interface to join the group on and send from; any() lets the kernel pick.
  asio::ip::address_v4 interface_address = asio::ip::address_v4::any();
  uint32_t host_ttl = 120;
  uint32_t service_ttl = 4500;
  std::chrono::seconds max_query_interval{60};
};

// mDNS responder and browser on a UDP multicast socket. All protocol state is
// owned by a private io thread; public calls post work onto it.
class MdnsResponder : public MulticastStack {
public:
  explicit MdnsResponder(std::shared_ptr<Logger> logger = nullptr, MdnsOptions options = {});
  ~MdnsResponder() override;

  MdnsResponder(const MdnsResponder&) = delete;
  MdnsResponder& operator=(const MdnsResponder&) = delete;

  void open() override;
  void register_service(const ServiceAdvertisement& service) override;
  void unregister_service(const ServiceAdvertisement& service) override;
  BrowseHandle add_listener(const std::string& service_type, BrowseHandlers handlers) override;
  void remove_listener(BrowseHandle handle) override;
  void close() override;

  bool is_open() const { return open_; }

private:
  using udp = asio::ip::udp;
  using clock = std::chrono::steady_clock;

  struct Registration {
    ServiceAdvertisement service;
    std::unique_ptr<asio::steady_timer> announce_timer;
  };

  struct CachedInstance {
    std::string type_key;
    ServiceAdvertisement service;   // accumulated from PTR/SRV/TXT
    ServiceAdvertisement published; // last value handed to listeners
    clock::time_point expiry;
    bool has_srv = false;
    bool announced = false;
    bool address_queried = false;
  };

  struct HostEntry {
    asio::ip::address_v4 address;
    clock::time_point expiry;
  };

  struct Listener {
    std::string type_key;
    BrowseHandlers handlers;
    std::unique_ptr<asio::steady_timer> timer;
    std::chrono::seconds interval{1};
  };

  using EventList = std::vector<std::function<void()>>;

  void ensure_open() const;
  void start_receive();
  void handle_packet(std::size_t size);
  void handle_query(const DnsMessage& query, const udp::endpoint& sender);
  void handle_response(const DnsMessage& response);

  void refresh_instance(const std::string& key, EventList& events);
  void drop_instance(const std::string& key, EventList& events);
  bool is_browsed(const std::string& type_key) const;
  std::optional<std::string> browsed_type_for(const std::string& instance_key) const;

  void schedule_announce(const std::string& key);
  void schedule_browse_query(BrowseHandle handle);
  void schedule_sweep();
  void sweep_expired();

  void send_query(const std::string& name, DnsType type);
  void send_message(const DnsMessage& message, const udp::endpoint& destination);
  void send_bytes(std::vector<uint8_t> bytes, const udp::endpoint& destination);
  udp::endpoint group_endpoint() const;

  DnsMessage make_announcement(const ServiceAdvertisement& service, bool goodbye) const;
  void run_events(EventList& events);

  std::shared_ptr<Logger> logger_;
  MdnsOptions options_;

  std::mutex lifecycle_mutex_;
  std::atomic<bool> open_{false};
  std::unique_ptr<asio::io_context> io_;
  std::unique_ptr<udp::socket> socket_;
  std::unique_ptr<asio::steady_timer> sweep_timer_;
  std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_;
  std::thread io_thread_;
  bool closing_ = false;

  std::array<uint8_t, 9000> recv_buffer_{};
  udp::endpoint sender_;

  // io thread only
  std::map<std::string, Registration> registrations_;
  std::map<std::string, CachedInstance> instances_;
  std::map<std::string, HostEntry> hosts_;
  std::map<BrowseHandle, Listener> listeners_;
  std::atomic<BrowseHandle> next_handle_{1};
};
