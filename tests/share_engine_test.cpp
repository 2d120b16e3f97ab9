#include "ShareCLI.hpp"
#include "in_memory_multicast.hpp"
#include "settings_manager.hpp"
#include "share_engine.hpp"
#include "share_errors.hpp"
#include "test_runner_utils.hpp"
#include "utils.hpp"

#include <fstream>
#include <sstream>
#include <vector>

namespace {

using share::test::InMemoryStack;
using share::test::TempDir;
using share::test::TestCase;
using share::test::TestContext;
using share::test::read_file;
using share::test::wait_for_condition;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

std::shared_ptr<SettingsManager> loopback_settings(const TempDir& dir, const std::string& host_id) {
  auto settings = std::make_shared<SettingsManager>();
  settings->set_settings_path(dir.path() / (host_id + ".json"));
  auto configure = [&](const std::string& key, const nlohmann::json& value){
    std::string error;
    if(!settings->set_value(key, value, error)) {
      throw std::runtime_error("Failed to set setting " + key + ": " + error);
    }
  };
  configure("port", 0);
  configure("bind_ip", "127.0.0.1");
  configure("advertise_ip", "127.0.0.1");
  configure("host_id", host_id);
  configure("serve_threads", 2);
  configure("chunk_size", 1024);
  return settings;
}

// Pops events until one of `kind` arrives; every popped event is kept.
std::optional<ShareEvent> wait_for_event(ShareEngine& engine, ShareEvent::Kind kind,
                                         std::vector<ShareEvent>& seen,
                                         std::chrono::milliseconds timeout = 10s) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while(std::chrono::steady_clock::now() < deadline) {
    auto event = engine.events().pop_for(100ms);
    if(!event) continue;
    seen.push_back(*event);
    if(event->kind == kind) return event;
  }
  return std::nullopt;
}

bool test_shared_folder_bootstrap(TestContext&) {
  TempDir dir("bootstrap");
  auto folder = dir.path() / "Public";
  bool created = ShareEngine::ensure_shared_folder(folder, "Welcome.txt");
  auto welcome = read_file(folder / "Welcome.txt");
  bool again = ShareEngine::ensure_shared_folder(folder, "Welcome.txt");
  auto file = dir.write("plain", "x");
  bool not_a_folder = ShareEngine::ensure_shared_folder(file, "Welcome.txt");
  return created && again && !not_a_folder && welcome.find("LanShare") != std::string::npos;
}

bool test_auth_without_password(TestContext&) {
  TempDir dir("no_password");
  auto settings = loopback_settings(dir, "alpha");
  std::string error;
  settings->set_value("auth_enabled", true, error);
  ShareEngine::Options options;
  options.shared_folder = dir.path() / "share";
  options.multicast = std::make_shared<InMemoryStack>();
  ShareEngine engine(settings, options);
  try {
    engine.start();
  } catch(const ServeError&) {
    return !engine.running();
  }
  return false;
}

bool test_discovery_failure_degrades(TestContext& ctx) {
  TempDir dir("degraded");
  auto stack = std::make_shared<InMemoryStack>();
  stack->fail_open = true;
  ShareEngine::Options options;
  options.shared_folder = dir.path() / "share";
  options.multicast = stack;
  ShareEngine engine(loopback_settings(dir, "alpha"), options);
  ctx.logs.attach(engine);
  engine.start();
  bool ok = engine.running() && !engine.discovery_active() && engine.port() != 0 &&
            !engine.local_urls().empty() &&
            ctx.logs.contains("Discovery unavailable");
  engine.stop();
  engine.stop();
  return ok;
}

bool test_download_between_engines(TestContext& ctx) {
  TempDir dir("engines");
  auto stack = std::make_shared<InMemoryStack>();

  auto alpha_settings = loopback_settings(dir, "alpha");
  std::string error;
  alpha_settings->set_value("auth_enabled", true, error);
  alpha_settings->set_value("username", "alice", error);
  alpha_settings->set_value("password_hash", hash_password("pw"), error);
  ShareEngine::Options alpha_options;
  alpha_options.shared_folder = dir.path() / "alpha_share";
  alpha_options.multicast = stack;
  fs::create_directories(alpha_options.shared_folder / "music" / "live");
  std::ofstream(alpha_options.shared_folder / "music" / "intro.ogg") << std::string(2500, 'i');
  std::ofstream(alpha_options.shared_folder / "music" / "live" / "encore.ogg") << "encore";

  ShareEngine::Options beta_options;
  beta_options.shared_folder = dir.path() / "beta_share";
  beta_options.multicast = stack;

  ShareEngine alpha(alpha_settings, alpha_options);
  ShareEngine beta(loopback_settings(dir, "beta"), beta_options);
  ctx.logs.attach(beta, "beta");
  alpha.start();
  beta.start();

  if(!wait_for_condition([&]{ return beta.find_peer("alpha").has_value(); }, 5s)) return false;
  auto peer = *beta.find_peer("alpha");
  bool self_hidden = !beta.find_peer("beta").has_value() && alpha.find_peer("beta").has_value();

  auto dest = dir.path() / "downloads";
  if(!beta.start_download(peer, {"music"}, dest)) return false;

  std::vector<ShareEvent> seen;
  auto auth = wait_for_event(beta, ShareEvent::Kind::AuthRequired, seen);
  if(!auth || !auth->credential_request) return false;
  auth->credential_request->answer(Credentials{"alice", "pw"});
  auto done = wait_for_event(beta, ShareEvent::Kind::BatchComplete, seen);
  beta.wait_for_download();

  bool saw_progress = false;
  bool saw_file = false;
  for(const auto& event : seen) {
    if(event.kind == ShareEvent::Kind::Progress) saw_progress = true;
    if(event.kind == ShareEvent::Kind::FileComplete) saw_file = true;
  }

  // credentials are remembered for later listings of the same peer
  auto listing = beta.list_remote(peer, "music");

  alpha.stop();
  bool removed = wait_for_condition([&]{ return !beta.find_peer("alpha").has_value(); }, 2s);
  beta.stop();

  return self_hidden && done && done->summary.files_downloaded == 2 &&
         done->summary.failures.empty() && saw_progress && saw_file &&
         read_file(dest / "music" / "intro.ogg").size() == 2500 &&
         read_file(dest / "music" / "live" / "encore.ogg") == "encore" &&
         listing.status == 207 && listing.entries.size() == 2 &&
         removed;
}

bool test_cli_commands(TestContext&) {
  TempDir dir("cli");
  auto stack = std::make_shared<InMemoryStack>();
  ShareEngine::Options alpha_options;
  alpha_options.shared_folder = dir.path() / "alpha_share";
  alpha_options.multicast = stack;
  fs::create_directories(alpha_options.shared_folder / "docs");
  std::ofstream(alpha_options.shared_folder / "docs" / "plan.txt") << "plan";

  ShareEngine::Options beta_options;
  beta_options.shared_folder = dir.path() / "beta_share";
  beta_options.multicast = stack;

  auto alpha = std::make_shared<ShareEngine>(loopback_settings(dir, "alpha"), alpha_options);
  auto beta_settings = loopback_settings(dir, "beta");
  auto beta = std::make_shared<ShareEngine>(beta_settings, beta_options);
  alpha->start();
  beta->start();
  if(!wait_for_condition([&]{ return beta->find_peer("alpha").has_value(); }, 5s)) return false;

  std::ostringstream out;
  ShareCLI cli(beta, beta_settings, out);
  auto run = [&](const std::string& line){
    out.str("");
    cli.execute_command(line);
    return out.str();
  };

  auto peers = run("peers");
  auto listing = run("ls alpha docs");
  auto unknown_peer = run("ls gamma");
  auto urls = run("urls");
  auto status = run("auth status");
  auto set_chunk = run("set chunk 4096");
  auto bad_set = run("set port banana");
  auto get_port = run("settings get p");
  auto help = run("help");
  auto unknown = run("frobnicate");

  auto request = std::make_shared<CredentialRequest>("alpha");
  ShareEvent event;
  event.kind = ShareEvent::Kind::AuthRequired;
  event.message = "alpha";
  event.credential_request = request;
  cli.print_event(event);
  auto cancelled = run("login cancel");
  bool answered_nullopt = !request->wait(1s).has_value();
  auto nobody = run("login cancel");

  auto auth_off = run("auth off");
  bool keeps_running = cli.execute_command("status");
  bool quits = !cli.execute_command("quit");

  beta->stop();
  alpha->stop();

  return peers.find("alpha") != std::string::npos &&
         peers.find("127.0.0.1:" + std::to_string(alpha->port())) != std::string::npos &&
         listing.find("plan.txt") != std::string::npos &&
         unknown_peer.find("Unknown peer 'gamma'") != std::string::npos &&
         urls.find("http://127.0.0.1:") != std::string::npos &&
         status.find("Authentication is off") != std::string::npos &&
         set_chunk.find("chunk_size = 4096") != std::string::npos &&
         beta_settings->get<long long>("chunk_size") == 4096 &&
         bad_set.find("Failed to set port") != std::string::npos &&
         get_port.find("port = 0") != std::string::npos &&
         help.find("get <peer> <path>...") != std::string::npos &&
         unknown.find("Unknown command: frobnicate") != std::string::npos &&
         cancelled.find("Authentication cancelled.") != std::string::npos &&
         answered_nullopt &&
         nobody.find("Nobody is asking") != std::string::npos &&
         auth_off.find("Authentication disabled.") != std::string::npos &&
         keeps_running && quits;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"shared_folder_bootstrap", test_shared_folder_bootstrap},
    {"auth_without_password", test_auth_without_password},
    {"discovery_failure_degrades", test_discovery_failure_degrades},
    {"download_between_engines", test_download_between_engines},
    {"cli_commands", test_cli_commands}
  };
  return share::test::run_test_cases("share engine", tests, argc, argv);
}
