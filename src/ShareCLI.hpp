#pragma once
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <readline/readline.h>
#include <readline/history.h>
#include <termios.h>
#include <unistd.h>

#include "settings_manager.hpp"
#include "share_engine.hpp"
#include "share_errors.hpp"
#include "utils.hpp"

class ShareCLI {
public:
  ShareCLI(std::shared_ptr<ShareEngine> engine,
           std::shared_ptr<SettingsManager> settings,
           std::ostream& out = std::cout)
    : engine_(std::move(engine)), settings_(std::move(settings)), out_(out) {}

  ~ShareCLI() {
    stop();
  }

  void start() {
    running_ = true;
    events_thread_ = std::thread([this](){ event_loop(); });
    cli_thread_ = std::thread([this](){ run_loop(); });
  }

  // Returns once the user quits or input ends.
  void wait() {
    if(cli_thread_.joinable()) cli_thread_.join();
  }

  void stop() {
    running_ = false;
    if(events_thread_.joinable()) events_thread_.join();
    // readline cannot be interrupted; the loop exits after the current line
    if(cli_thread_.joinable() && cli_thread_.get_id() != std::this_thread::get_id()) {
      cli_thread_.join();
    }
  }

  bool running() const { return running_; }

  // Runs one command line; false when it asked to quit.
  bool execute_command(const std::string& line) {
    std::istringstream iss(line);
    std::string cmd;
    iss >> cmd;
    if(cmd.empty()) return true;
    std::string args;
    std::getline(iss, args);
    args = trim_copy(args);

    if(cmd == "peers" || cmd == "p") {
      list_peers();
    } else if(cmd == "refresh" || cmd == "r") {
      engine_->refresh_peers();
      say("Searching for peers...");
    } else if(cmd == "ls" || cmd == "list" || cmd == "l") {
      list_command(args);
    } else if(cmd == "get" || cmd == "download") {
      get_command(args);
    } else if(cmd == "cancel") {
      if(engine_->download_running()) {
        engine_->cancel_download();
        say("Cancelling download...");
      } else {
        say("No download is running.");
      }
    } else if(cmd == "login") {
      login_command(args);
    } else if(cmd == "auth") {
      auth_command(args);
    } else if(cmd == "urls") {
      print_urls();
    } else if(cmd == "status") {
      print_status();
    } else if(cmd == "settings" || cmd == "s") {
      handle_settings_command(args.empty() ? "list" : args);
    } else if(cmd == "set") {
      handle_settings_command(args.empty() ? "list" : "set " + args);
    } else if(cmd == "help" || cmd == "h" || cmd == "?") {
      print_help();
    } else if(cmd == "quit" || cmd == "exit" || cmd == "q") {
      say("Quitting...");
      running_ = false;
      return false;
    } else {
      say("Unknown command: " + cmd + " (try 'help')");
    }
    return true;
  }

  // Handles one engine event; exposed so callers without the event thread
  // can drain the channel themselves.
  void print_event(const ShareEvent& event) {
    switch(event.kind) {
      case ShareEvent::Kind::PeerAdded:
        say("[peer] + " + event.peer.display_name + " (" + event.peer.base_url() + ")");
        break;
      case ShareEvent::Kind::PeerUpdated:
        say("[peer] ~ " + event.peer.display_name + " (" + event.peer.base_url() + ")");
        break;
      case ShareEvent::Kind::PeerRemoved:
        say("[peer] - " + event.peer.display_name);
        break;
      case ShareEvent::Kind::Progress:
        if(progress_enabled()) {
          say("[get] " + event.progress.item_name + ": " + event.progress.describe());
        }
        break;
      case ShareEvent::Kind::StateChanged:
        if(event.state == BatchState::Aborted) say("[get] Download aborted.");
        break;
      case ShareEvent::Kind::FileComplete:
        say("[get] Saved " + event.message + " (" + format_bytes(event.progress.bytes_done) + ")");
        break;
      case ShareEvent::Kind::Failure:
        say("[get] " + event.failure.item_name + " failed: " + event.failure.reason);
        break;
      case ShareEvent::Kind::BatchComplete:
        print_summary(event.summary);
        break;
      case ShareEvent::Kind::AuthRequired: {
        {
          std::lock_guard lg(request_mutex_);
          pending_request_ = event.credential_request;
        }
        say("[auth] " + event.message + " requires a username and password. "
            "Type 'login <username>' or 'login cancel'.");
        break;
      }
    }
  }

private:
  // Disables echo for password entry.
  struct TerminalModeGuard {
    bool active = false;
    termios original{};

    bool activate() {
      if(!isatty(STDIN_FILENO)) return false;
      if(tcgetattr(STDIN_FILENO, &original) == -1) return false;
      termios quiet = original;
      quiet.c_lflag &= ~ECHO;
      if(tcsetattr(STDIN_FILENO, TCSAFLUSH, &quiet) == -1) return false;
      active = true;
      return true;
    }

    ~TerminalModeGuard() {
      if(active) {
        tcsetattr(STDIN_FILENO, TCSAFLUSH, &original);
      }
    }
  };

  void run_loop() {
    while(running_) {
      auto input = read_command_line("> ");
      if(!input) {
        running_ = false;
        break;
      }
      if(input->empty()) continue;
      if(!execute_command(*input)) break;
    }
  }

  void event_loop() {
    while(running_) {
      auto event = engine_->events().pop_for(std::chrono::milliseconds(200));
      if(!event) {
        if(engine_->events().closed()) break;
        continue;
      }
      print_event(*event);
      prompt_again();
    }
  }

  std::optional<std::string> read_command_line(const char* prompt) {
    char* line = readline(prompt);
    if(!line) return std::nullopt;
    std::string result(line);
    if(!result.empty()) add_history(result.c_str());
    free(line);
    return result;
  }

  std::optional<std::string> read_password(const std::string& prompt) {
    {
      std::lock_guard lg(out_mutex_);
      out_ << prompt;
      out_.flush();
    }
    TerminalModeGuard guard;
    guard.activate();
    std::string password;
    if(!std::getline(std::cin, password)) return std::nullopt;
    say("");
    return password;
  }

  std::optional<Credentials> prompt_credentials(const std::string& peer_name, const std::string& username = {}) {
    Credentials creds;
    creds.username = username;
    if(creds.username.empty()) {
      auto entered = read_command_line(("Username for " + peer_name + ": ").c_str());
      if(!entered || trim_copy(*entered).empty()) return std::nullopt;
      creds.username = trim_copy(*entered);
    }
    auto password = read_password("Password: ");
    if(!password) return std::nullopt;
    creds.password = *password;
    return creds;
  }

  void say(const std::string& line) {
    std::lock_guard lg(out_mutex_);
    out_ << line << "\n";
    out_.flush();
  }

  void prompt_again() {
    if(&out_ != &std::cout || !isatty(STDOUT_FILENO)) return;
    std::lock_guard lg(out_mutex_);
    out_ << "> ";
    out_.flush();
  }

  bool progress_enabled() const {
    return settings_->get<bool>("transfer_progress");
  }

  std::optional<PeerRecord> require_peer(const std::string& name) {
    if(name.empty()) {
      say("Missing peer name (see 'peers').");
      return std::nullopt;
    }
    auto peer = engine_->find_peer(name);
    if(!peer) say("Unknown peer '" + name + "'.");
    return peer;
  }

  void list_peers() {
    auto peers = engine_->peers();
    if(peers.empty()) {
      say("No peers discovered yet.");
      return;
    }
    auto now = std::chrono::system_clock::now();
    std::lock_guard lg(out_mutex_);
    for(const auto& peer : peers) {
      auto age = std::chrono::duration_cast<std::chrono::seconds>(now - peer.last_seen).count();
      out_ << std::left << std::setw(24) << peer.display_name
           << std::setw(24) << (peer.address.to_string() + ":" + std::to_string(peer.port))
           << "seen " << age << "s ago\n";
    }
    out_.flush();
  }

  void list_command(const std::string& args) {
    std::istringstream iss(args);
    std::string name;
    iss >> name;
    std::string path;
    std::getline(iss, path);
    path = trim_copy(path);
    auto peer = require_peer(name);
    if(!peer) return;

    ListingResult result;
    try {
      result = engine_->list_remote(*peer, path);
      if(result.status == 401) {
        auto creds = prompt_credentials(peer->display_name);
        if(!creds) {
          say("Authentication cancelled.");
          return;
        }
        result = engine_->list_remote(*peer, path, creds);
        if(result.status == 401) {
          say("Authentication failed for " + peer->display_name + ".");
          return;
        }
      }
    } catch(const ListingError& e) {
      say("Could not list " + (path.empty() ? std::string("/") : path) + ": " + e.what());
      return;
    }
    if(result.status != 207) {
      say("Could not list " + (path.empty() ? std::string("/") : path) + ": " +
          (result.error.empty() ? "HTTP " + std::to_string(result.status) : result.error));
      return;
    }
    if(result.entries.empty()) {
      say("(empty)");
      return;
    }
    std::lock_guard lg(out_mutex_);
    for(const auto& entry : result.entries) {
      if(entry.is_directory) {
        out_ << std::right << std::setw(12) << "<dir>" << "  " << entry.name << "/\n";
      } else {
        out_ << std::right << std::setw(12) << format_bytes(entry.size_bytes) << "  " << entry.name << "\n";
      }
    }
    out_.flush();
  }

  void get_command(const std::string& args) {
    std::istringstream iss(args);
    std::string name;
    iss >> name;
    std::vector<std::string> paths;
    std::filesystem::path destination;
    std::string token;
    while(iss >> token) {
      if(token == "--to") {
        std::string dir;
        std::getline(iss, dir);
        destination = trim_copy(dir);
        break;
      }
      paths.push_back(token == "/" ? std::string() : token);
    }
    if(paths.empty()) {
      say("Usage: get <peer> <path>... [--to <dir>]");
      return;
    }
    auto peer = require_peer(name);
    if(!peer) return;

    if(destination.empty()) {
      auto configured = settings_->get<std::string>("download_dir");
      destination = configured.empty() ? std::filesystem::current_path() : std::filesystem::path(configured);
    }
    if(!engine_->start_download(*peer, paths, destination)) {
      say("A download is already running (use 'cancel').");
      return;
    }
    say("Downloading " + std::to_string(paths.size()) + " item(s) from " + peer->display_name +
        " into " + destination.string());
  }

  void login_command(const std::string& args) {
    std::shared_ptr<CredentialRequest> request;
    {
      std::lock_guard lg(request_mutex_);
      request = std::move(pending_request_);
      pending_request_.reset();
    }
    if(!request) {
      say("Nobody is asking for credentials.");
      return;
    }
    if(args == "cancel") {
      request->answer(std::nullopt);
      say("Authentication cancelled.");
      return;
    }
    auto creds = prompt_credentials(request->peer_name(), args);
    request->answer(creds);
  }

  void auth_command(const std::string& args) {
    std::istringstream iss(args);
    std::string action;
    iss >> action;
    if(action.empty() || action == "status") {
      say(std::string("Authentication is ") + (engine_->auth_enabled() ? "on" : "off") +
          " (user '" + settings_->get<std::string>("username") + "')");
      return;
    }
    if(action == "off") {
      if(engine_->set_auth(false, "", "")) say("Authentication disabled.");
      return;
    }
    if(action == "on") {
      std::string user;
      std::string password;
      iss >> user;
      std::getline(iss, password);
      password = trim_copy(password);
      if(password.empty() && settings_->get<std::string>("password_hash").empty()) {
        auto entered = read_password("New share password: ");
        if(!entered || entered->empty()) {
          say("Authentication unchanged.");
          return;
        }
        password = *entered;
      }
      if(engine_->set_auth(true, user, password)) {
        say("Authentication enabled for user '" + settings_->get<std::string>("username") + "'.");
      } else {
        say("Authentication unchanged.");
      }
      return;
    }
    say("Usage: auth [on [user] [password]|off|status]");
  }

  void print_urls() {
    auto urls = engine_->local_urls();
    if(urls.empty()) {
      say("The share is not running.");
      return;
    }
    say("Sharing " + engine_->shared_folder().string() + " at:");
    for(const auto& url : urls) say("  " + url);
  }

  void print_status() {
    auto stats = engine_->stats();
    std::ostringstream oss;
    oss << "peers: " << stats.known_peers
        << ", connections: " << stats.open_connections
        << ", discovery: " << (stats.discovery ? "on" : "off")
        << ", download: " << (stats.downloading ? "running" : "idle");
    if(auto id = engine_->local_service_id(); !id.empty()) oss << ", advertised as " << id;
    say(oss.str());
  }

  void print_summary(const BatchSummary& summary) {
    say("[get] Finished: " + summary.describe());
    for(const auto& failure : summary.failures) {
      say("  - " + failure.item_name + ": " + failure.reason);
    }
  }

  void handle_settings_command(const std::string& args) {
    std::istringstream iss(args);
    std::string action;
    iss >> action;

    if(action == "list") {
      list_settings();
      return;
    }
    if(action == "get") {
      std::string key;
      iss >> key;
      auto resolved = settings_->resolve_key(key);
      if(!resolved) {
        say("Unknown setting '" + key + "'.");
        return;
      }
      say(*resolved + " = " + display_value(*resolved));
      return;
    }
    if(action == "set") {
      std::string key;
      iss >> key;
      std::string value;
      std::getline(iss, value);
      value = trim_copy(value);
      if(key.empty() || value.empty()) {
        say("Usage: set <key> <value>");
        return;
      }
      auto resolved = settings_->resolve_key(key);
      if(!resolved) {
        say("Unknown setting '" + key + "'.");
        return;
      }
      if(*resolved == "password" || *resolved == "password_hash") {
        say("Use 'auth on' to change the share password.");
        return;
      }
      std::string error;
      if(!settings_->set_from_string(*resolved, value, error)) {
        say("Failed to set " + *resolved + ": " + error);
        return;
      }
      say(*resolved + " = " + display_value(*resolved));
      if(*resolved == "auth_enabled" || *resolved == "username") {
        engine_->set_auth(settings_->get<bool>("auth_enabled"), settings_->get<std::string>("username"), "");
      } else if(*resolved == "verbose") {
        init(settings_->get<bool>("verbose"), settings_->get<std::string>("log_file"));
      } else if(*resolved != "transfer_progress" && *resolved != "download_dir" && *resolved != "chunk_size") {
        say("(takes effect after a restart)");
      }
      return;
    }
    if(action == "save") {
      if(settings_->save()) {
        say("Saved settings to " + settings_->settings_path().string());
      } else {
        say("Failed to save settings.");
      }
      return;
    }
    if(action == "load") {
      if(settings_->load()) {
        say("Loaded settings from " + settings_->settings_path().string());
      } else {
        say("No settings file at " + settings_->settings_path().string());
      }
      return;
    }
    say("Usage: settings [list|get <key>|set <key> <value>|save|load]");
  }

  std::string display_value(const std::string& key) const {
    if(key == "password_hash") {
      return settings_->get<std::string>(key).empty() ? "(unset)" : "(set)";
    }
    return settings_->value_as_string(key);
  }

  void list_settings() {
    std::lock_guard lg(out_mutex_);
    for(const auto& spec : settings_->specs()) {
      if(spec.key == "password" || spec.key == "help" || spec.key == "save") continue;
      out_ << "  " << std::left << std::setw(20) << spec.key
           << std::setw(24) << display_value(spec.key)
           << spec.description << "\n";
    }
    out_.flush();
  }

  void print_help() {
    std::lock_guard lg(out_mutex_);
    out_ << "Available commands:\n";
    out_ << "  peers|p                           List peers on the network\n";
    out_ << "  refresh|r                         Search for peers again\n";
    out_ << "  ls <peer> [path]                  List a folder on a peer\n";
    out_ << "  get <peer> <path>... [--to dir]   Download files or folders\n";
    out_ << "  cancel                            Stop the running download\n";
    out_ << "  login <user>|cancel               Answer a credential request\n";
    out_ << "  auth [on [user] [pw]|off|status]  Protect this share with a password\n";
    out_ << "  urls                              Show the addresses of this share\n";
    out_ << "  status                            Show peers, connections and downloads\n";
    out_ << "  settings [list|get|set|save|load] Manage settings\n";
    out_ << "  set <key> <value>                 Shortcut for settings set\n";
    out_ << "  help|h|?                          Show this help message\n";
    out_ << "  quit|exit|q                       Exit the application\n";
    out_.flush();
  }

  std::shared_ptr<ShareEngine> engine_;
  std::shared_ptr<SettingsManager> settings_;
  std::ostream& out_;
  std::mutex out_mutex_;
  std::atomic<bool> running_{false};
  std::thread cli_thread_;
  std::thread events_thread_;

  std::mutex request_mutex_;
  std::shared_ptr<CredentialRequest> pending_request_;
};
