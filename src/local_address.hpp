#pragma once
#include <asio.hpp>
#include <functional>
#include <optional>
#include <vector>
#include "log.hpp"

// Address the OS would route towards `route_target` from; no packet is sent.
std::optional<asio::ip::address_v4> route_source_address(
    const asio::ip::address_v4& route_target = asio::ip::make_address_v4("8.8.8.8"),
    uint16_t route_port = 80);

// IPv4 addresses of interfaces that are up, excluding loopback and 169.254/16.
std::vector<asio::ip::address_v4> interface_addresses();
std::optional<asio::ip::address_v4> first_interface_address();

bool is_link_local(const asio::ip::address_v4& address);

using AddressSource = std::function<std::optional<asio::ip::address_v4>()>;

// First usable answer from `sources`, else 127.0.0.1. Loopback and link-local
// answers are skipped.
asio::ip::address_v4 resolve_local_address(const std::vector<AddressSource>& sources,
                                           Logger* logger = nullptr);
asio::ip::address_v4 resolve_local_address(Logger* logger = nullptr);
