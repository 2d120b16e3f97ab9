#include "mdns_responder.hpp"

#include <future>
#include <stdexcept>
#include <sys/socket.h>

namespace {

#ifdef SO_REUSEPORT
using reuse_port = asio::detail::socket_option::boolean<SOL_SOCKET, SO_REUSEPORT>;
#endif

// "LanShare-box._webdav._tcp.local." minus "._webdav._tcp.local." -> "LanShare-box"
std::string instance_label(const std::string& full_name, const std::string& service_type) {
  auto full = full_name;
  if(!full.empty() && full.back() == '.') full.pop_back();
  auto type = service_type;
  if(!type.empty() && type.back() == '.') type.pop_back();
  if(full.size() > type.size() + 1) {
    auto tail = full.substr(full.size() - type.size());
    if(dns_names_equal(tail, type) && full[full.size() - type.size() - 1] == '.') {
      return full.substr(0, full.size() - type.size() - 1);
    }
  }
  auto dot = full.find('.');
  return dot == std::string::npos ? full : full.substr(0, dot);
}

bool same_advertisement(const ServiceAdvertisement& a, const ServiceAdvertisement& b) {
  return a.address == b.address && a.port == b.port &&
         dns_names_equal(a.host_name, b.host_name) && a.properties == b.properties;
}

} // namespace

MdnsResponder::MdnsResponder(std::shared_ptr<Logger> logger, MdnsOptions options)
  : logger_(std::move(logger)),
    options_(std::move(options))
{
}

MdnsResponder::~MdnsResponder(){
  close();
}

void MdnsResponder::ensure_open() const {
  if(!open_) throw std::runtime_error("mDNS responder is not open");
}

MdnsResponder::udp::endpoint MdnsResponder::group_endpoint() const {
  return udp::endpoint(options_.group, options_.port);
}

void MdnsResponder::open(){
  std::lock_guard lifecycle(lifecycle_mutex_);
  if(open_) return;

  auto io = std::make_unique<asio::io_context>();
  auto socket = std::make_unique<udp::socket>(*io);
  try {
    socket->open(udp::v4());
    socket->set_option(udp::socket::reuse_address(true));
#ifdef SO_REUSEPORT
    socket->set_option(reuse_port(true));
#endif
    socket->bind(udp::endpoint(asio::ip::address_v4::any(), options_.port));
    if(options_.interface_address.is_unspecified()) {
      socket->set_option(asio::ip::multicast::join_group(options_.group));
    } else {
      socket->set_option(asio::ip::multicast::join_group(options_.group, options_.interface_address));
      socket->set_option(asio::ip::multicast::outbound_interface(options_.interface_address));
    }
    socket->set_option(asio::ip::multicast::enable_loopback(true));
    socket->set_option(asio::ip::multicast::hops(255));
  } catch(const std::system_error& e) {
    log_error(logger_.get(), "mDNS socket setup on port {} failed: {}", options_.port, e.what());
    throw;
  }

  io_ = std::move(io);
  socket_ = std::move(socket);
  sweep_timer_ = std::make_unique<asio::steady_timer>(*io_);
  work_.emplace(asio::make_work_guard(*io_));
  closing_ = false;
  open_ = true;

  start_receive();
  schedule_sweep();
  io_thread_ = std::thread([this](){
    try {
      io_->run();
    } catch(const std::exception& e) {
      log_error(logger_.get(), "mDNS io thread terminated: {}", e.what());
    }
  });
  log_debug(logger_.get(), "mDNS responder listening on {}:{}", options_.group.to_string(), options_.port);
}

void MdnsResponder::close(){
  std::lock_guard lifecycle(lifecycle_mutex_);
  if(!open_) return;
  open_ = false;

  asio::post(*io_, [this](){
    closing_ = true;
    std::error_code ec;
    sweep_timer_->cancel(ec);
    for(auto& kv : registrations_) {
      if(kv.second.announce_timer) kv.second.announce_timer->cancel(ec);
    }
    registrations_.clear();
    listeners_.clear();
    instances_.clear();
    hosts_.clear();
    socket_->close(ec);
  });
  work_.reset();
  if(io_thread_.joinable()) io_thread_.join();

  sweep_timer_.reset();
  socket_.reset();
  io_.reset();
  log_debug(logger_.get(), "mDNS responder closed");
}

void MdnsResponder::register_service(const ServiceAdvertisement& service){
  ensure_open();
  // Encoding here surfaces malformed names to the caller.
  auto packet = encode_dns_message(make_announcement(service, false));
  auto key = canonical_dns_name(service.full_name());

  asio::post(*io_, [this, key, service, packet = std::move(packet)]() mutable {
    if(closing_) return;
    auto& reg = registrations_[key];
    reg.service = service;
    reg.announce_timer = std::make_unique<asio::steady_timer>(*io_);
    send_bytes(std::move(packet), group_endpoint());
    schedule_announce(key);
  });
  log_info(logger_.get(), "Registered {} on port {}", service.full_name(), service.port);
}

void MdnsResponder::schedule_announce(const std::string& key){
  auto it = registrations_.find(key);
  if(it == registrations_.end()) return;
  // Second announcement one second after the first.
  it->second.announce_timer->expires_after(std::chrono::seconds(1));
  it->second.announce_timer->async_wait([this, key](const std::error_code& ec){
    if(ec || closing_) return;
    auto reg = registrations_.find(key);
    if(reg == registrations_.end()) return;
    send_message(make_announcement(reg->second.service, false), group_endpoint());
  });
}

void MdnsResponder::unregister_service(const ServiceAdvertisement& service){
  if(!open_) return;
  auto packet = encode_dns_message(make_announcement(service, true));
  auto key = canonical_dns_name(service.full_name());

  auto done = std::make_shared<std::promise<void>>();
  auto sent = done->get_future();
  asio::post(*io_, [this, key, done, packet = std::move(packet)](){
    auto it = registrations_.find(key);
    if(it != registrations_.end()) {
      std::error_code ec;
      if(it->second.announce_timer) it->second.announce_timer->cancel(ec);
      registrations_.erase(it);
    }
    if(!closing_) {
      std::error_code ec;
      socket_->send_to(asio::buffer(packet), group_endpoint(), 0, ec);
      if(ec) log_warn(logger_.get(), "mDNS goodbye failed: {}", ec.message());
    }
    done->set_value();
  });
  if(sent.wait_for(std::chrono::seconds(2)) != std::future_status::ready) {
    log_warn(logger_.get(), "Timed out sending goodbye for {}", service.full_name());
    return;
  }
  log_info(logger_.get(), "Unregistered {}", service.full_name());
}

BrowseHandle MdnsResponder::add_listener(const std::string& service_type, BrowseHandlers handlers){
  ensure_open();
  auto handle = next_handle_++;
  auto type_key = canonical_dns_name(service_type);
  asio::post(*io_, [this, handle, type_key, handlers = std::move(handlers)]() mutable {
    if(closing_) return;
    Listener listener;
    listener.type_key = type_key;
    listener.handlers = std::move(handlers);
    listener.timer = std::make_unique<asio::steady_timer>(*io_);
    auto& stored = listeners_.emplace(handle, std::move(listener)).first->second;

    EventList events;
    for(const auto& kv : instances_) {
      if(kv.second.announced && kv.second.type_key == type_key && stored.handlers.added) {
        auto added = stored.handlers.added;
        auto snapshot = kv.second.published;
        events.push_back([added, snapshot](){ added(snapshot); });
      }
    }
    run_events(events);

    send_query(type_key, DnsType::PTR);
    schedule_browse_query(handle);
  });
  return handle;
}

void MdnsResponder::remove_listener(BrowseHandle handle){
  if(!open_) return;
  asio::post(*io_, [this, handle](){
    listeners_.erase(handle);
  });
}

void MdnsResponder::schedule_browse_query(BrowseHandle handle){
  auto it = listeners_.find(handle);
  if(it == listeners_.end()) return;
  auto& listener = it->second;
  listener.timer->expires_after(listener.interval);
  listener.timer->async_wait([this, handle](const std::error_code& ec){
    if(ec || closing_) return;
    auto found = listeners_.find(handle);
    if(found == listeners_.end()) return;
    send_query(found->second.type_key, DnsType::PTR);
    found->second.interval = std::min(found->second.interval * 2, options_.max_query_interval);
    schedule_browse_query(handle);
  });
}

void MdnsResponder::schedule_sweep(){
  sweep_timer_->expires_after(std::chrono::seconds(1));
  sweep_timer_->async_wait([this](const std::error_code& ec){
    if(ec || closing_) return;
    sweep_expired();
    schedule_sweep();
  });
}

void MdnsResponder::sweep_expired(){
  auto now = clock::now();
  EventList events;
  std::vector<std::string> expired;
  for(const auto& kv : instances_) {
    if(kv.second.expiry <= now) expired.push_back(kv.first);
  }
  for(const auto& key : expired) {
    log_debug(logger_.get(), "mDNS record expired: {}", key);
    drop_instance(key, events);
  }
  for(auto it = hosts_.begin(); it != hosts_.end();) {
    if(it->second.expiry <= now) {
      it = hosts_.erase(it);
    } else {
      ++it;
    }
  }
  run_events(events);
}

void MdnsResponder::start_receive(){
  socket_->async_receive_from(asio::buffer(recv_buffer_), sender_,
    [this](const std::error_code& ec, std::size_t bytes){
      if(ec) {
        if(ec != asio::error::operation_aborted && !closing_) {
          log_warn(logger_.get(), "mDNS receive failed: {}", ec.message());
          start_receive();
        }
        return;
      }
      handle_packet(bytes);
      if(!closing_) start_receive();
    });
}

void MdnsResponder::handle_packet(std::size_t size){
  DnsMessage message;
  try {
    message = decode_dns_message(recv_buffer_.data(), size);
  } catch(const DnsFormatError& e) {
    log_debug(logger_.get(), "Ignoring malformed mDNS packet from {}: {}",
              sender_.address().to_string(), e.what());
    return;
  }
  if(message.is_response()) {
    handle_response(message);
  } else {
    handle_query(message, sender_);
  }
}

void MdnsResponder::handle_query(const DnsMessage& query, const udp::endpoint& sender){
  if(registrations_.empty()) return;

  DnsMessage reply;
  reply.flags = kDnsFlagResponse | kDnsFlagAuthoritative;
  // Queries from a port other than 5353 are legacy unicast and expect the id
  // and question echoed back to the sender.
  const bool legacy = sender.port() != options_.port;
  if(legacy) {
    reply.id = query.id;
    reply.questions = query.questions;
  }

  for(const auto& question : query.questions) {
    auto qkey = canonical_dns_name(question.name);
    const bool any = question.type == DnsType::ANY;
    for(const auto& kv : registrations_) {
      const auto& svc = kv.second.service;
      auto records = make_announcement(svc, false).answers;
      // records: PTR, SRV, TXT, A
      if((any || question.type == DnsType::PTR) && qkey == canonical_dns_name(svc.service_type)) {
        reply.answers.push_back(records[0]);
        reply.additionals.insert(reply.additionals.end(), records.begin() + 1, records.end());
      } else if(qkey == kv.first) {
        if(any || question.type == DnsType::SRV) reply.answers.push_back(records[1]);
        if(any || question.type == DnsType::TXT) reply.answers.push_back(records[2]);
        if(!reply.answers.empty()) reply.additionals.push_back(records[3]);
      } else if((any || question.type == DnsType::A) && qkey == canonical_dns_name(svc.host_name)) {
        reply.answers.push_back(records[3]);
      }
    }
  }
  if(reply.answers.empty()) return;
  send_message(reply, legacy ? sender : group_endpoint());
}

void MdnsResponder::handle_response(const DnsMessage& response){
  std::vector<const DnsRecord*> records;
  for(const auto& rec : response.answers) records.push_back(&rec);
  for(const auto& rec : response.additionals) records.push_back(&rec);

  auto now = clock::now();
  std::set<std::string> touched;
  EventList events;

  for(const auto* rec : records) {
    if(rec->type != DnsType::PTR) continue;
    auto type_key = canonical_dns_name(rec->name);
    if(!is_browsed(type_key)) continue;
    auto key = canonical_dns_name(rec->target);
    if(rec->ttl == 0) {
      drop_instance(key, events);
      touched.erase(key);
      continue;
    }
    auto& inst = instances_[key];
    if(inst.type_key.empty()) {
      inst.type_key = type_key;
      inst.service.service_type = rec->name;
      inst.service.instance_name = instance_label(rec->target, rec->name);
    }
    inst.expiry = now + std::chrono::seconds(rec->ttl);
    touched.insert(key);
  }

  for(const auto* rec : records) {
    if(rec->type != DnsType::A) continue;
    auto host_key = canonical_dns_name(rec->name);
    if(rec->ttl == 0) {
      hosts_.erase(host_key);
      continue;
    }
    hosts_[host_key] = HostEntry{rec->address, now + std::chrono::seconds(rec->ttl)};
    for(const auto& kv : instances_) {
      if(kv.second.has_srv && canonical_dns_name(kv.second.service.host_name) == host_key) {
        touched.insert(kv.first);
      }
    }
  }

  for(const auto* rec : records) {
    if(rec->type != DnsType::SRV && rec->type != DnsType::TXT) continue;
    auto key = canonical_dns_name(rec->name);
    auto it = instances_.find(key);
    if(it == instances_.end()) {
      if(rec->ttl == 0) continue;
      auto type_key = browsed_type_for(key);
      if(!type_key) continue;
      auto& inst = instances_[key];
      inst.type_key = *type_key;
      inst.service.service_type = *type_key;
      inst.service.instance_name = instance_label(rec->name, *type_key);
      inst.expiry = now + std::chrono::seconds(rec->ttl);
      it = instances_.find(key);
    }
    auto& inst = it->second;
    if(rec->type == DnsType::SRV) {
      if(rec->ttl == 0) {
        drop_instance(key, events);
        touched.erase(key);
        continue;
      }
      if(!inst.has_srv || !dns_names_equal(inst.service.host_name, rec->target)) {
        inst.address_queried = false;
      }
      inst.service.host_name = rec->target;
      inst.service.port = rec->port;
      inst.has_srv = true;
    } else {
      inst.service.properties = rec->txt;
    }
    touched.insert(key);
  }

  for(const auto& key : touched) {
    refresh_instance(key, events);
  }
  run_events(events);
}

void MdnsResponder::refresh_instance(const std::string& key, EventList& events){
  auto it = instances_.find(key);
  if(it == instances_.end()) return;
  auto& inst = it->second;
  if(!inst.has_srv) return;

  auto host = hosts_.find(canonical_dns_name(inst.service.host_name));
  if(host == hosts_.end()) {
    if(!inst.address_queried) {
      inst.address_queried = true;
      send_query(inst.service.host_name, DnsType::A);
    }
    return;
  }
  inst.service.address = host->second.address;

  const bool is_new = !inst.announced;
  if(!is_new && same_advertisement(inst.published, inst.service)) {
    for(const auto& kv : listeners_) {
      if(kv.second.type_key != inst.type_key || !kv.second.handlers.refreshed) continue;
      auto refreshed = kv.second.handlers.refreshed;
      auto snapshot = inst.published;
      events.push_back([refreshed, snapshot](){ refreshed(snapshot); });
    }
    return;
  }
  inst.announced = true;
  inst.published = inst.service;

  for(const auto& kv : listeners_) {
    if(kv.second.type_key != inst.type_key) continue;
    auto snapshot = inst.published;
    if(is_new && kv.second.handlers.added) {
      auto added = kv.second.handlers.added;
      events.push_back([added, snapshot](){ added(snapshot); });
    } else if(!is_new && kv.second.handlers.updated) {
      auto updated = kv.second.handlers.updated;
      events.push_back([updated, snapshot](){ updated(snapshot); });
    }
  }
}

void MdnsResponder::drop_instance(const std::string& key, EventList& events){
  auto it = instances_.find(key);
  if(it == instances_.end()) return;
  if(it->second.announced) {
    auto full_name = it->second.published.full_name();
    for(const auto& kv : listeners_) {
      if(kv.second.type_key != it->second.type_key || !kv.second.handlers.removed) continue;
      auto removed = kv.second.handlers.removed;
      events.push_back([removed, full_name](){ removed(full_name); });
    }
  }
  instances_.erase(it);
}

bool MdnsResponder::is_browsed(const std::string& type_key) const {
  for(const auto& kv : listeners_) {
    if(kv.second.type_key == type_key) return true;
  }
  return false;
}

std::optional<std::string> MdnsResponder::browsed_type_for(const std::string& instance_key) const {
  for(const auto& kv : listeners_) {
    const auto& type = kv.second.type_key;
    if(instance_key.size() > type.size() + 1 &&
       instance_key.compare(instance_key.size() - type.size(), type.size(), type) == 0 &&
       instance_key[instance_key.size() - type.size() - 1] == '.') {
      return type;
    }
  }
  return std::nullopt;
}

void MdnsResponder::run_events(EventList& events){
  for(auto& event : events) {
    try {
      event();
    } catch(const std::exception& e) {
      log_error(logger_.get(), "mDNS listener threw: {}", e.what());
    }
  }
  events.clear();
}

DnsMessage MdnsResponder::make_announcement(const ServiceAdvertisement& service, bool goodbye) const {
  DnsMessage msg;
  msg.flags = kDnsFlagResponse | kDnsFlagAuthoritative;
  auto service_ttl = goodbye ? 0 : options_.service_ttl;
  auto host_ttl = goodbye ? 0 : options_.host_ttl;
  auto full = service.full_name();
  msg.answers.push_back(make_ptr_record(service.service_type, full, service_ttl));
  msg.answers.push_back(make_srv_record(full, service.host_name, service.port, host_ttl));
  msg.answers.push_back(make_txt_record(full, service.properties, service_ttl));
  msg.answers.push_back(make_a_record(service.host_name, service.address, host_ttl));
  return msg;
}

void MdnsResponder::send_query(const std::string& name, DnsType type){
  DnsMessage query;
  DnsQuestion question;
  question.name = name;
  question.type = type;
  query.questions.push_back(std::move(question));
  send_message(query, group_endpoint());
}

void MdnsResponder::send_message(const DnsMessage& message, const udp::endpoint& destination){
  std::vector<uint8_t> bytes;
  try {
    bytes = encode_dns_message(message);
  } catch(const DnsFormatError& e) {
    log_warn(logger_.get(), "Unable to encode mDNS message: {}", e.what());
    return;
  }
  send_bytes(std::move(bytes), destination);
}

void MdnsResponder::send_bytes(std::vector<uint8_t> bytes, const udp::endpoint& destination){
  if(!socket_ || closing_) return;
  auto buffer = std::make_shared<std::vector<uint8_t>>(std::move(bytes));
  socket_->async_send_to(asio::buffer(*buffer), destination,
    [this, buffer](const std::error_code& ec, std::size_t){
      if(ec && ec != asio::error::operation_aborted) {
        log_warn(logger_.get(), "mDNS send failed: {}", ec.message());
      }
    });
}
