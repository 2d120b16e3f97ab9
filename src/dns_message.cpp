#include "dns_message.hpp"

#include <algorithm>
#include <cctype>

namespace {

constexpr std::size_t kMaxLabel = 63;
constexpr std::size_t kMaxName = 255;
constexpr int kMaxPointerJumps = 32;

class Writer {
public:
  void u8(uint8_t v) { out_.push_back(v); }
  void u16(uint16_t v) {
    out_.push_back(static_cast<uint8_t>(v >> 8));
    out_.push_back(static_cast<uint8_t>(v & 0xff));
  }
  void u32(uint32_t v) {
    u16(static_cast<uint16_t>(v >> 16));
    u16(static_cast<uint16_t>(v & 0xffff));
  }
  void bytes(const void* data, std::size_t size) {
    auto p = static_cast<const uint8_t*>(data);
    out_.insert(out_.end(), p, p + size);
  }

  void name(const std::string& dotted) {
    std::size_t total = 1;
    std::size_t start = 0;
    while(start <= dotted.size()) {
      auto end = dotted.find('.', start);
      if(end == std::string::npos) end = dotted.size();
      auto len = end - start;
      if(len > 0) {
        if(len > kMaxLabel) throw DnsFormatError("DNS label too long: " + dotted);
        total += len + 1;
        if(total > kMaxName) throw DnsFormatError("DNS name too long: " + dotted);
        u8(static_cast<uint8_t>(len));
        bytes(dotted.data() + start, len);
      }
      start = end + 1;
    }
    u8(0);
  }

  std::size_t size() const { return out_.size(); }
  void patch_u16(std::size_t at, uint16_t v) {
    out_[at] = static_cast<uint8_t>(v >> 8);
    out_[at + 1] = static_cast<uint8_t>(v & 0xff);
  }
  std::vector<uint8_t> take() { return std::move(out_); }

private:
  std::vector<uint8_t> out_;
};

class Reader {
public:
  Reader(const uint8_t* data, std::size_t size) : data_(data), size_(size) {}

  void need(std::size_t n) const {
    if(pos_ + n > size_) throw DnsFormatError("truncated DNS message");
  }
  uint8_t u8() { need(1); return data_[pos_++]; }
  uint16_t u16() {
    need(2);
    uint16_t v = static_cast<uint16_t>((data_[pos_] << 8) | data_[pos_ + 1]);
    pos_ += 2;
    return v;
  }
  uint32_t u32() {
    uint32_t hi = u16();
    return (hi << 16) | u16();
  }

  std::string name() { return name_at(pos_, true); }

  // Reads a possibly compressed name starting at `offset`. When `advance` is
  // set the cursor moves past the in-place part of the name.
  std::string name_at(std::size_t offset, bool advance) {
    std::string result;
    std::size_t cursor = offset;
    std::size_t end_of_inline = 0;
    bool jumped = false;
    int jumps = 0;
    while(true) {
      if(cursor >= size_) throw DnsFormatError("DNS name out of bounds");
      uint8_t len = data_[cursor];
      if((len & 0xc0) == 0xc0) {
        if(cursor + 1 >= size_) throw DnsFormatError("truncated DNS pointer");
        if(++jumps > kMaxPointerJumps) throw DnsFormatError("DNS pointer loop");
        std::size_t target = static_cast<std::size_t>(((len & 0x3f) << 8) | data_[cursor + 1]);
        if(!jumped) end_of_inline = cursor + 2;
        jumped = true;
        cursor = target;
        continue;
      }
      if((len & 0xc0) != 0) throw DnsFormatError("unsupported DNS label type");
      if(len == 0) {
        if(!jumped) end_of_inline = cursor + 1;
        break;
      }
      if(cursor + 1 + len > size_) throw DnsFormatError("DNS label out of bounds");
      result.append(reinterpret_cast<const char*>(data_ + cursor + 1), len);
      result.push_back('.');
      if(result.size() > kMaxName) throw DnsFormatError("DNS name too long");
      cursor += 1 + len;
    }
    if(result.empty()) result = ".";
    if(advance) pos_ = end_of_inline;
    return result;
  }

  std::size_t pos() const { return pos_; }
  void skip(std::size_t n) { need(n); pos_ += n; }
  const uint8_t* at(std::size_t offset) const { return data_ + offset; }

private:
  const uint8_t* data_;
  std::size_t size_;
  std::size_t pos_ = 0;
};

void write_record(Writer& w, const DnsRecord& rec) {
  w.name(rec.name);
  w.u16(static_cast<uint16_t>(rec.type));
  w.u16(static_cast<uint16_t>(kDnsClassIn | (rec.cache_flush ? kDnsCacheFlush : 0)));
  w.u32(rec.ttl);
  auto length_at = w.size();
  w.u16(0);
  auto rdata_start = w.size();
  switch(rec.type) {
    case DnsType::A: {
      auto bytes = rec.address.to_bytes();
      w.bytes(bytes.data(), bytes.size());
      break;
    }
    case DnsType::PTR:
      w.name(rec.target);
      break;
    case DnsType::SRV:
      w.u16(rec.priority);
      w.u16(rec.weight);
      w.u16(rec.port);
      w.name(rec.target);
      break;
    case DnsType::TXT:
      if(rec.txt.empty()) {
        w.u8(0);
      }
      for(const auto& kv : rec.txt) {
        std::string entry = kv.second.empty() ? kv.first : kv.first + "=" + kv.second;
        if(entry.size() > 255) throw DnsFormatError("TXT entry too long: " + kv.first);
        w.u8(static_cast<uint8_t>(entry.size()));
        w.bytes(entry.data(), entry.size());
      }
      break;
    default:
      w.bytes(rec.raw.data(), rec.raw.size());
      break;
  }
  w.patch_u16(length_at, static_cast<uint16_t>(w.size() - rdata_start));
}

DnsRecord read_record(Reader& r) {
  DnsRecord rec;
  rec.name = r.name();
  rec.type = static_cast<DnsType>(r.u16());
  uint16_t rrclass = r.u16();
  rec.cache_flush = (rrclass & kDnsCacheFlush) != 0;
  rec.ttl = r.u32();
  uint16_t rdlength = r.u16();
  r.need(rdlength);
  std::size_t start = r.pos();
  std::size_t end = start + rdlength;

  switch(rec.type) {
    case DnsType::A: {
      if(rdlength != 4) throw DnsFormatError("bad A record length");
      asio::ip::address_v4::bytes_type bytes;
      std::copy(r.at(start), r.at(start) + 4, bytes.begin());
      rec.address = asio::ip::address_v4(bytes);
      break;
    }
    case DnsType::PTR:
      rec.target = r.name_at(start, false);
      break;
    case DnsType::SRV: {
      if(rdlength < 7) throw DnsFormatError("bad SRV record length");
      const uint8_t* p = r.at(start);
      rec.priority = static_cast<uint16_t>((p[0] << 8) | p[1]);
      rec.weight = static_cast<uint16_t>((p[2] << 8) | p[3]);
      rec.port = static_cast<uint16_t>((p[4] << 8) | p[5]);
      rec.target = r.name_at(start + 6, false);
      break;
    }
    case DnsType::TXT: {
      std::size_t cursor = start;
      while(cursor < end) {
        std::size_t len = *r.at(cursor);
        ++cursor;
        if(cursor + len > end) throw DnsFormatError("TXT entry out of bounds");
        std::string entry(reinterpret_cast<const char*>(r.at(cursor)), len);
        cursor += len;
        if(entry.empty()) continue;
        auto eq = entry.find('=');
        if(eq == std::string::npos) {
          rec.txt.emplace(entry, "");
        } else {
          rec.txt.emplace(entry.substr(0, eq), entry.substr(eq + 1));
        }
      }
      break;
    }
    default:
      rec.raw.assign(r.at(start), r.at(end));
      break;
  }
  r.skip(rdlength);
  return rec;
}

} // namespace

DnsRecord make_ptr_record(const std::string& name, const std::string& target, uint32_t ttl) {
  DnsRecord rec;
  rec.name = name;
  rec.type = DnsType::PTR;
  rec.ttl = ttl;
  rec.target = target;
  return rec;
}

DnsRecord make_srv_record(const std::string& name, const std::string& host, uint16_t port, uint32_t ttl) {
  DnsRecord rec;
  rec.name = name;
  rec.type = DnsType::SRV;
  rec.cache_flush = true;
  rec.ttl = ttl;
  rec.port = port;
  rec.target = host;
  return rec;
}

DnsRecord make_txt_record(const std::string& name,
                          const std::map<std::string, std::string>& properties,
                          uint32_t ttl) {
  DnsRecord rec;
  rec.name = name;
  rec.type = DnsType::TXT;
  rec.cache_flush = true;
  rec.ttl = ttl;
  rec.txt = properties;
  return rec;
}

DnsRecord make_a_record(const std::string& name, const asio::ip::address_v4& address, uint32_t ttl) {
  DnsRecord rec;
  rec.name = name;
  rec.type = DnsType::A;
  rec.cache_flush = true;
  rec.ttl = ttl;
  rec.address = address;
  return rec;
}

std::vector<uint8_t> encode_dns_message(const DnsMessage& message) {
  Writer w;
  w.u16(message.id);
  w.u16(message.flags);
  w.u16(static_cast<uint16_t>(message.questions.size()));
  w.u16(static_cast<uint16_t>(message.answers.size()));
  w.u16(static_cast<uint16_t>(message.authorities.size()));
  w.u16(static_cast<uint16_t>(message.additionals.size()));
  for(const auto& q : message.questions) {
    w.name(q.name);
    w.u16(static_cast<uint16_t>(q.type));
    w.u16(static_cast<uint16_t>(kDnsClassIn | (q.unicast_response ? kDnsUnicastReply : 0)));
  }
  for(const auto& rec : message.answers) write_record(w, rec);
  for(const auto& rec : message.authorities) write_record(w, rec);
  for(const auto& rec : message.additionals) write_record(w, rec);
  return w.take();
}

DnsMessage decode_dns_message(const uint8_t* data, std::size_t size) {
  Reader r(data, size);
  DnsMessage msg;
  msg.id = r.u16();
  msg.flags = r.u16();
  uint16_t qd = r.u16();
  uint16_t an = r.u16();
  uint16_t ns = r.u16();
  uint16_t ar = r.u16();
  for(uint16_t i = 0; i < qd; ++i) {
    DnsQuestion q;
    q.name = r.name();
    q.type = static_cast<DnsType>(r.u16());
    q.unicast_response = (r.u16() & kDnsUnicastReply) != 0;
    msg.questions.push_back(std::move(q));
  }
  for(uint16_t i = 0; i < an; ++i) msg.answers.push_back(read_record(r));
  for(uint16_t i = 0; i < ns; ++i) msg.authorities.push_back(read_record(r));
  for(uint16_t i = 0; i < ar; ++i) msg.additionals.push_back(read_record(r));
  return msg;
}

std::string canonical_dns_name(const std::string& name) {
  std::string out;
  out.reserve(name.size() + 1);
  for(unsigned char ch : name) out.push_back(static_cast<char>(std::tolower(ch)));
  if(out.empty() || out.back() != '.') out.push_back('.');
  return out;
}

bool dns_names_equal(const std::string& a, const std::string& b) {
  return canonical_dns_name(a) == canonical_dns_name(b);
}
