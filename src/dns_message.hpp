#pragma once
#include <asio.hpp>
#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

// Minimal DNS wire codec for the mDNS / DNS-SD records the discovery layer
// uses (A, PTR, TXT, SRV). Other record types are decoded as opaque.

enum class DnsType : uint16_t {
  A = 1,
  PTR = 12,
  TXT = 16,
  AAAA = 28,
  SRV = 33,
  ANY = 255
};

inline constexpr uint16_t kDnsClassIn = 1;
inline constexpr uint16_t kDnsCacheFlush = 0x8000;   // mDNS: top bit of rrclass
inline constexpr uint16_t kDnsUnicastReply = 0x8000; // mDNS: top bit of qclass
inline constexpr uint16_t kDnsFlagResponse = 0x8000;
inline constexpr uint16_t kDnsFlagAuthoritative = 0x0400;

class DnsFormatError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct DnsQuestion {
  std::string name;
  DnsType type = DnsType::PTR;
  bool unicast_response = false;
};

struct DnsRecord {
  std::string name;
  DnsType type = DnsType::A;
  bool cache_flush = false;
  uint32_t ttl = 0;

  // PTR target / SRV target host
  std::string target;
  uint16_t priority = 0;
  uint16_t weight = 0;
  uint16_t port = 0;
  std::map<std::string, std::string> txt;
  asio::ip::address_v4 address;
  std::vector<uint8_t> raw; // rdata of types not listed above
};

struct DnsMessage {
  uint16_t id = 0;
  uint16_t flags = 0;
  std::vector<DnsQuestion> questions;
  std::vector<DnsRecord> answers;
  std::vector<DnsRecord> authorities;
  std::vector<DnsRecord> additionals;

  bool is_response() const { return (flags & kDnsFlagResponse) != 0; }
};

DnsRecord make_ptr_record(const std::string& name, const std::string& target, uint32_t ttl);
DnsRecord make_srv_record(const std::string& name, const std::string& host, uint16_t port, uint32_t ttl);
DnsRecord make_txt_record(const std::string& name,
                          const std::map<std::string, std::string>& properties,
                          uint32_t ttl);
DnsRecord make_a_record(const std::string& name, const asio::ip::address_v4& address, uint32_t ttl);

std::vector<uint8_t> encode_dns_message(const DnsMessage& message);
DnsMessage decode_dns_message(const uint8_t* data, std::size_t size);

// "Foo.Bar." and "foo.bar" compare equal.
bool dns_names_equal(const std::string& a, const std::string& b);
std::string canonical_dns_name(const std::string& name);
