#include "presence_registry.hpp"
#include "test_runner_utils.hpp"

#include <vector>

namespace {

using share::test::TestCase;
using share::test::TestContext;

asio::ip::address ip(const char* text) {
  return asio::ip::make_address(text);
}

bool test_add_update_remove(TestContext& ctx) {
  auto logger = std::make_shared<Logger>("presence");
  ctx.logs.attach(logger);
  PresenceRegistry registry(logger);

  registry.on_peer_added("LanShare-alpha", "alpha", ip("192.168.1.10"), 8080);
  registry.on_peer_added("LanShare-beta", "beta", ip("192.168.1.11"), 8080);
  registry.on_peer_updated("LanShare-alpha", "alpha", ip("192.168.1.20"), 9090);
  registry.on_peer_removed("LanShare-beta");

  auto snap = registry.snapshot();
  if(snap.size() != 1) return false;
  auto it = snap.find("LanShare-alpha");
  if(it == snap.end()) return false;
  return it->second.address == ip("192.168.1.20") &&
         it->second.port == 9090 &&
         it->second.display_name == "alpha" &&
         ctx.logs.contains("Peer removed: LanShare-beta");
}

bool test_remove_unknown_is_ignored(TestContext&) {
  PresenceRegistry registry;
  int callbacks = 0;
  registry.set_change_callback([&](PresenceRegistry::Change, const PeerRecord&){ ++callbacks; });
  registry.on_peer_removed("LanShare-ghost");
  return registry.size() == 0 && callbacks == 0;
}

bool test_change_notifications(TestContext&) {
  PresenceRegistry registry;
  std::vector<PresenceRegistry::Change> seen;
  registry.set_change_callback([&](PresenceRegistry::Change change, const PeerRecord&){
    seen.push_back(change);
  });

  registry.on_peer_added("LanShare-alpha", "alpha", ip("10.0.0.2"), 8080);
  // same endpoint again only refreshes last_seen
  registry.on_peer_added("LanShare-alpha", "alpha", ip("10.0.0.2"), 8080);
  registry.on_peer_updated("LanShare-alpha", "alpha", ip("10.0.0.3"), 8080);
  registry.on_peer_removed("LanShare-alpha");

  std::vector<PresenceRegistry::Change> expected = {
    PresenceRegistry::Change::Added,
    PresenceRegistry::Change::Updated,
    PresenceRegistry::Change::Removed
  };
  return seen == expected;
}

bool test_callback_may_read_registry(TestContext&) {
  PresenceRegistry registry;
  std::size_t size_in_callback = 0;
  registry.set_change_callback([&](PresenceRegistry::Change, const PeerRecord&){
    size_in_callback = registry.snapshot().size();
  });
  registry.on_peer_added("LanShare-alpha", "alpha", ip("10.0.0.2"), 8080);
  return size_in_callback == 1;
}

bool test_find_by_display_name(TestContext&) {
  PresenceRegistry registry;
  registry.on_peer_added("LanShare-Office-PC", "Office-PC", ip("10.0.0.7"), 8080);

  auto by_id = registry.find("LanShare-Office-PC");
  auto by_name = registry.find("office-pc");
  auto missing = registry.find("kitchen");
  return by_id && by_name && !missing &&
         by_name->service_id == "LanShare-Office-PC" &&
         by_name->base_url() == "http://10.0.0.7:8080";
}

bool test_clear_reports_removals(TestContext&) {
  PresenceRegistry registry;
  registry.on_peer_added("LanShare-a", "a", ip("10.0.0.2"), 8080);
  registry.on_peer_added("LanShare-b", "b", ip("10.0.0.3"), 8080);
  int removed = 0;
  registry.set_change_callback([&](PresenceRegistry::Change change, const PeerRecord&){
    if(change == PresenceRegistry::Change::Removed) ++removed;
  });
  registry.clear();
  return removed == 2 && registry.size() == 0;
}

bool test_ipv6_base_url(TestContext&) {
  PeerRecord record;
  record.address = ip("fe80::1");
  record.port = 8080;
  return record.base_url() == "http://[fe80::1]:8080";
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"add_update_remove", test_add_update_remove},
    {"remove_unknown_is_ignored", test_remove_unknown_is_ignored},
    {"change_notifications", test_change_notifications},
    {"callback_may_read_registry", test_callback_may_read_registry},
    {"find_by_display_name", test_find_by_display_name},
    {"clear_reports_removals", test_clear_reports_removals},
    {"ipv6_base_url", test_ipv6_base_url}
  };
  return share::test::run_test_cases("presence registry", tests, argc, argv);
}
