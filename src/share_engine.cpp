#include "share_engine.hpp"

#include <cstdlib>
#include <fstream>

#include "discovery_session.hpp"
#include "mdns_responder.hpp"
#include "serving_session.hpp"
#include "settings_manager.hpp"
#include "share_errors.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

namespace {

constexpr std::chrono::milliseconds kProgressInterval{200};

CredentialVerifier make_verifier(std::string password_hash) {
  return [hash = std::move(password_hash)](const std::string&, const std::string& password){
    return !hash.empty() && verify_password(password, hash);
  };
}

uint16_t port_setting(const SettingsManager& settings) {
  auto value = settings.get<long long>("port");
  if(value < 0 || value > 65535) {
    throw ServeError("Invalid port " + std::to_string(value));
  }
  return static_cast<uint16_t>(value);
}

} // namespace

ShareEngine::ShareEngine(std::shared_ptr<SettingsManager> settings, Options options)
  : settings_(settings ? std::move(settings) : std::make_shared<SettingsManager>()),
    options_(std::move(options)),
    logger_(std::make_shared<Logger>("lanshare")),
    serving_logger_(std::make_shared<Logger>("serving")),
    discovery_logger_(std::make_shared<Logger>("discovery")),
    transfer_logger_(std::make_shared<Logger>("transfer")),
    registry_(std::make_shared<PresenceRegistry>(std::make_shared<Logger>("presence")))
{}

ShareEngine::~ShareEngine() {
  stop();
}

fs::path ShareEngine::default_shared_folder() {
  if(const char* home = std::getenv("HOME"); home && *home) {
    return fs::path(home) / "Public";
  }
  return fs::current_path() / "Public";
}

bool ShareEngine::ensure_shared_folder(const fs::path& folder, const std::string& welcome_file, Logger* logger) {
  std::error_code ec;
  if(fs::exists(folder, ec)) return fs::is_directory(folder, ec);
  fs::create_directories(folder, ec);
  if(ec) {
    log_error(logger, "Failed to create shared folder {}: {}", folder.string(), ec.message());
    return false;
  }
  log_info(logger, "Created shared folder {}", folder.string());
  if(welcome_file.empty()) return true;

  std::ofstream out(folder / welcome_file);
  out << "Welcome to LanShare!\n\n"
         "This folder is shared with other LanShare users on your local network.\n\n"
         "You can:\n"
         "- Put files here to share them\n"
         "- Create folders to organize your shared content\n"
         "- Run 'urls' in lanshare to see the addresses it is reachable on\n\n"
         "Happy sharing!\n";
  if(!out) {
    log_warn(logger, "Unable to write welcome file in {}", folder.string());
  }
  return true;
}

void ShareEngine::start() {
  if(started_) return;

  shared_folder_ = options_.shared_folder;
  if(shared_folder_.empty()) shared_folder_ = settings_->get<std::string>("shared_folder");
  if(shared_folder_.empty()) shared_folder_ = default_shared_folder();
  if(!ensure_shared_folder(shared_folder_, options_.welcome_file, logger_.get())) {
    throw ServeError("Shared folder is unusable: " + shared_folder_.string());
  }

  ServiceConfig config;
  config.shared_folder = shared_folder_;
  config.port = port_setting(*settings_);
  config.bind_ip = settings_->get<std::string>("bind_ip");
  config.auth_enabled = settings_->get<bool>("auth_enabled");
  config.username = settings_->get<std::string>("username");
  auto hash = settings_->get<std::string>("password_hash");
  if(config.auth_enabled && hash.empty()) {
    throw ServeError("Authentication is enabled but no password is set (use --password)");
  }
  config.credential_verifier = make_verifier(hash);
  auto threads = settings_->get<long long>("serve_threads");
  config.worker_threads = threads > 0 ? static_cast<std::size_t>(threads) : 1;

  serving_ = std::make_unique<ServingSession>(config, serving_logger_);
  serving_->start();

  registry_->set_change_callback([this](PresenceRegistry::Change change, const PeerRecord& record){
    ShareEvent event;
    switch(change) {
      case PresenceRegistry::Change::Added: event.kind = ShareEvent::Kind::PeerAdded; break;
      case PresenceRegistry::Change::Updated: event.kind = ShareEvent::Kind::PeerUpdated; break;
      case PresenceRegistry::Change::Removed: event.kind = ShareEvent::Kind::PeerRemoved; break;
    }
    event.peer = record;
    events_.push(std::move(event));
  });

  started_ = true;
  if(settings_->get<bool>("discovery")) {
    start_discovery();
  } else {
    logger_->info("Discovery disabled; peers will not see this share");
  }

  for(const auto& url : serving_->local_urls()) {
    logger_->info("Sharing {} at {}", shared_folder_.string(), url);
  }
}

void ShareEngine::start_discovery() {
  multicast_ = options_.multicast ? options_.multicast
                                  : std::make_shared<MdnsResponder>(discovery_logger_);
  DiscoveryOptions options;
  options.app_prefix = settings_->get<std::string>("app_prefix");
  options.host_id = settings_->get<std::string>("host_id");
  options.advertise_ip = settings_->get<std::string>("advertise_ip");
  options.port = serving_->bound_port();

  discovery_ = std::make_unique<DiscoverySession>(multicast_, registry_, options, discovery_logger_);
  try {
    discovery_->start();
  } catch(const RegistrationError& e) {
    logger_->warn("Discovery unavailable, sharing without advertisement: {}", e.what());
    discovery_.reset();
  }
}

void ShareEngine::stop() {
  if(!started_) return;
  started_ = false;

  cancel_download();
  // a worker asking for credentials after this point gets no answer channel
  events_.close();
  cancel_download();
  wait_for_download();

  if(discovery_) discovery_->stop();
  discovery_.reset();
  multicast_.reset();
  registry_->set_change_callback(nullptr);
  registry_->clear();

  if(serving_) serving_->stop();
}

bool ShareEngine::discovery_active() const {
  return discovery_ && discovery_->running();
}

std::vector<PeerRecord> ShareEngine::peers() const {
  std::vector<PeerRecord> out;
  for(auto& [id, record] : registry_->snapshot()) out.push_back(record);
  return out;
}

std::optional<PeerRecord> ShareEngine::find_peer(const std::string& name) const {
  return registry_->find(name);
}

void ShareEngine::refresh_peers() {
  if(!discovery_) {
    logger_->warn("Discovery is not running");
    return;
  }
  discovery_->trigger_rediscovery();
}

std::string ShareEngine::local_service_id() const {
  return discovery_ ? discovery_->local_service_id() : std::string();
}

uint16_t ShareEngine::port() const {
  return serving_ ? serving_->bound_port() : 0;
}

std::shared_ptr<RemoteShare> ShareEngine::make_remote(const PeerRecord& peer) const {
  return std::make_shared<WebDavClient>(peer.address.to_string(), peer.port, transfer_logger_);
}

void ShareEngine::remember_credentials(const PeerRecord& peer, const Credentials& credentials) {
  std::lock_guard lg(credentials_mutex_);
  peer_credentials_[peer.service_id] = credentials;
}

ListingResult ShareEngine::list_remote(const PeerRecord& peer,
                                       const std::string& remote_path,
                                       const std::optional<Credentials>& credentials) {
  auto effective = credentials;
  if(!effective) {
    std::lock_guard lg(credentials_mutex_);
    auto it = peer_credentials_.find(peer.service_id);
    if(it != peer_credentials_.end()) effective = it->second;
  }
  auto result = make_remote(peer)->list_directory(remote_path, effective);
  if(result.status == 207 && credentials) remember_credentials(peer, *credentials);
  return result;
}

std::optional<Credentials> ShareEngine::ask_credentials(const std::string& peer_name) {
  auto request = std::make_shared<CredentialRequest>(peer_name);
  {
    std::lock_guard lg(credentials_mutex_);
    pending_request_ = request;
  }
  ShareEvent event;
  event.kind = ShareEvent::Kind::AuthRequired;
  event.message = peer_name;
  event.credential_request = request;
  if(!events_.push(std::move(event))) return std::nullopt;

  auto answer = request->wait(options_.credential_timeout);
  {
    std::lock_guard lg(credentials_mutex_);
    if(pending_request_ == request) pending_request_.reset();
  }
  return answer;
}

TransferCallbacks ShareEngine::make_transfer_callbacks(const PeerRecord& peer) {
  TransferCallbacks callbacks;
  auto throttle = std::make_shared<ProgressThrottle>(kProgressInterval);
  auto push_progress = [this, peer](const TransferProgress& progress){
    ShareEvent event;
    event.kind = ShareEvent::Kind::Progress;
    event.peer = peer;
    event.progress = progress;
    events_.push(std::move(event));
  };

  callbacks.on_progress = [throttle, push_progress](const TransferProgress& progress){
    if(throttle->admit(progress)) push_progress(progress);
  };
  callbacks.on_state = [this, peer](BatchState state){
    ShareEvent event;
    event.kind = ShareEvent::Kind::StateChanged;
    event.peer = peer;
    event.state = state;
    events_.push(std::move(event));
  };
  callbacks.on_failure = [this, peer, throttle](const TransferFailure& failure){
    // a held-back update of the failed file must not surface later
    throttle->take_pending();
    ShareEvent event;
    event.kind = ShareEvent::Kind::Failure;
    event.peer = peer;
    event.failure = failure;
    events_.push(std::move(event));
  };
  callbacks.on_file_complete = [this, peer, throttle, push_progress](const std::string& remote_path,
                                                                      const fs::path& local_path,
                                                                      uint64_t bytes){
    // the last line of an unknown-length file is otherwise lost to the throttle
    if(auto pending = throttle->take_pending()) push_progress(*pending);
    ShareEvent event;
    event.kind = ShareEvent::Kind::FileComplete;
    event.peer = peer;
    event.message = local_path.string();
    event.progress.remote_path = remote_path;
    event.progress.bytes_done = bytes;
    event.progress.bytes_total = bytes;
    events_.push(std::move(event));
  };
  callbacks.on_auth_required = [this](const std::string& peer_name){
    return ask_credentials(peer_name);
  };
  return callbacks;
}

bool ShareEngine::start_download(const PeerRecord& peer,
                                 const std::vector<std::string>& remote_paths,
                                 const fs::path& destination) {
  if(remote_paths.empty()) return false;
  std::lock_guard lg(transfer_mutex_);
  if(transfer_ && transfer_->busy()) return false;
  transfer_.reset();

  TransferConfig config;
  auto chunk = settings_->get<long long>("chunk_size");
  config.chunk_size = chunk > 0 ? static_cast<std::size_t>(chunk) : 1024 * 1024;
  config.peer_name = peer.display_name;
  {
    std::lock_guard cl(credentials_mutex_);
    auto it = peer_credentials_.find(peer.service_id);
    if(it != peer_credentials_.end()) config.credentials = it->second;
  }
  transfer_ = std::make_unique<TransferEngine>(make_remote(peer), config, transfer_logger_);

  std::vector<TransferTask> tasks;
  for(const auto& path : remote_paths) {
    TransferTask task;
    task.remote_path = normalize_remote_path(path);
    task.detect_kind = true;
    auto name = remote_basename(task.remote_path);
    if(name.empty()) name = peer.display_name;
    task.display_name = name;
    task.local_path = destination / sanitize_local_name(name);
    tasks.push_back(std::move(task));
  }

  auto callbacks = make_transfer_callbacks(peer);
  TransferEngine* engine = transfer_.get();
  callbacks.on_complete = [this, peer, engine](const BatchSummary& summary){
    if(auto creds = engine->credentials()) remember_credentials(peer, *creds);
    ShareEvent event;
    event.kind = ShareEvent::Kind::BatchComplete;
    event.peer = peer;
    event.summary = summary;
    events_.push(std::move(event));
  };
  logger_->info("Downloading {} item(s) from {} into {}", tasks.size(), peer.display_name, destination.string());
  return transfer_->start_batch(std::move(tasks), std::move(callbacks));
}

void ShareEngine::cancel_download() {
  {
    std::lock_guard lg(transfer_mutex_);
    if(transfer_) transfer_->cancel();
  }
  std::shared_ptr<CredentialRequest> pending;
  {
    std::lock_guard lg(credentials_mutex_);
    pending = pending_request_;
  }
  if(pending) pending->answer(std::nullopt);
}

bool ShareEngine::download_running() const {
  std::lock_guard lg(transfer_mutex_);
  return transfer_ && transfer_->busy();
}

void ShareEngine::wait_for_download() {
  std::lock_guard lg(transfer_mutex_);
  if(transfer_) transfer_->wait();
}

bool ShareEngine::set_auth(bool enabled, const std::string& username, const std::string& password) {
  std::string error;
  auto user = username.empty() ? settings_->get<std::string>("username") : username;
  auto hash = settings_->get<std::string>("password_hash");
  if(!password.empty()) hash = hash_password(password);
  if(enabled && hash.empty()) {
    logger_->error("A password is required to enable authentication");
    return false;
  }
  if(!settings_->set_value("auth_enabled", enabled, error) ||
     !settings_->set_value("username", user, error) ||
     !settings_->set_value("password_hash", hash, error)) {
    logger_->error("Unable to update authentication settings: {}", error);
    return false;
  }
  if(serving_) serving_->set_auth(enabled, user, make_verifier(hash));
  return true;
}

bool ShareEngine::auth_enabled() const {
  return serving_ ? serving_->auth_enabled() : settings_->get<bool>("auth_enabled");
}

std::vector<std::string> ShareEngine::local_urls() const {
  if(!serving_) return {};
  return serving_->local_urls();
}

LogListenerHandle ShareEngine::add_log_listener(Logger::Listener listener, void* user_data) {
  return logger_->add_listener(std::move(listener), user_data);
}

void ShareEngine::remove_log_listener(LogListenerHandle handle) {
  if(handle != 0) logger_->remove_listener(handle);
}

void ShareEngine::clear_log_listeners() {
  logger_->clear_listeners();
}

ShareEngine::Stats ShareEngine::stats() const {
  Stats s;
  s.known_peers = registry_->size();
  s.open_connections = serving_ ? serving_->active_connections() : 0;
  s.discovery = discovery_active();
  s.downloading = download_running();
  return s;
}
