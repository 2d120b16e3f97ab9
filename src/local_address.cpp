#include "local_address.hpp"

#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <memory>

std::optional<asio::ip::address_v4> route_source_address(const asio::ip::address_v4& route_target,
                                                         uint16_t route_port)
{
  asio::io_context io;
  asio::ip::udp::socket socket(io);
  std::error_code ec;
  socket.open(asio::ip::udp::v4(), ec);
  if(ec) return std::nullopt;
  socket.connect(asio::ip::udp::endpoint(route_target, route_port), ec);
  if(ec) return std::nullopt;
  auto local = socket.local_endpoint(ec);
  if(ec || !local.address().is_v4()) return std::nullopt;
  return local.address().to_v4();
}

bool is_link_local(const asio::ip::address_v4& address){
  return (address.to_uint() & 0xffff0000u) == 0xa9fe0000u;
}

std::vector<asio::ip::address_v4> interface_addresses(){
  std::vector<asio::ip::address_v4> out;
  ifaddrs* raw = nullptr;
  if(getifaddrs(&raw) != 0) return out;
  std::unique_ptr<ifaddrs, decltype(&freeifaddrs)> list(raw, &freeifaddrs);

  for(auto* ifa = list.get(); ifa != nullptr; ifa = ifa->ifa_next) {
    if(!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET) continue;
    if(!(ifa->ifa_flags & IFF_UP) || (ifa->ifa_flags & IFF_LOOPBACK)) continue;
    auto* sin = reinterpret_cast<const sockaddr_in*>(ifa->ifa_addr);
    asio::ip::address_v4 address(ntohl(sin->sin_addr.s_addr));
    if(address.is_loopback() || is_link_local(address)) continue;
    out.push_back(address);
  }
  return out;
}

std::optional<asio::ip::address_v4> first_interface_address(){
  auto all = interface_addresses();
  if(all.empty()) return std::nullopt;
  return all.front();
}

asio::ip::address_v4 resolve_local_address(const std::vector<AddressSource>& sources, Logger* logger){
  for(const auto& source : sources) {
    if(!source) continue;
    auto address = source();
    if(!address || address->is_unspecified() || address->is_loopback() || is_link_local(*address)) {
      continue;
    }
    log_debug(logger, "Using local address {}", address->to_string());
    return *address;
  }
  log_warn(logger, "No LAN address found, advertising 127.0.0.1");
  return asio::ip::address_v4::loopback();
}

asio::ip::address_v4 resolve_local_address(Logger* logger){
  return resolve_local_address({
    [](){ return route_source_address(); },
    [](){ return first_interface_address(); }
  }, logger);
}
