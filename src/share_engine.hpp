#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "event_channel.hpp"
#include "log.hpp"
#include "presence_registry.hpp"
#include "transfer_engine.hpp"
#include "webdav_client.hpp"

class DiscoverySession;
class MulticastStack;
class ServingSession;
class SettingsManager;

// A credential question from a transfer worker; answered once by the UI.
class CredentialRequest {
public:
  explicit CredentialRequest(std::string peer_name) : peer_name_(std::move(peer_name)) {}

  const std::string& peer_name() const { return peer_name_; }

  // Later answers are ignored.
  void answer(std::optional<Credentials> credentials) {
    if(answered_.exchange(true)) return;
    promise_.set_value(std::move(credentials));
  }

  std::optional<Credentials> wait(std::chrono::seconds timeout) {
    auto future = promise_.get_future();
    if(future.wait_for(timeout) != std::future_status::ready) {
      answer(std::nullopt);
    }
    return future.get();
  }

private:
  std::string peer_name_;
  std::promise<std::optional<Credentials>> promise_;
  std::atomic<bool> answered_{false};
};

struct ShareEvent {
  enum class Kind {
    PeerAdded,
    PeerUpdated,
    PeerRemoved,
    Progress,
    StateChanged,
    FileComplete,
    Failure,
    BatchComplete,
    AuthRequired
  };

  Kind kind = Kind::PeerAdded;
  PeerRecord peer;
  TransferProgress progress;
  BatchState state = BatchState::Idle;
  TransferFailure failure;
  BatchSummary summary;
  std::string message;
  std::shared_ptr<CredentialRequest> credential_request;
};

// Owns the serving session, discovery and the transfer worker, and turns
// their callbacks into ShareEvents for the UI.
class ShareEngine {
public:
  struct Options {
    std::filesystem::path shared_folder;          // overrides the setting when set
    std::shared_ptr<MulticastStack> multicast;    // default: an MdnsResponder
    std::chrono::seconds credential_timeout{300};
    std::string welcome_file = "Welcome to LanShare.txt";
  };

  ShareEngine(std::shared_ptr<SettingsManager> settings, Options options);
  ~ShareEngine();

  ShareEngine(const ShareEngine&) = delete;
  ShareEngine& operator=(const ShareEngine&) = delete;

  // Throws ServeError. A discovery failure only disables discovery.
  void start();
  void stop();
  bool running() const { return started_; }
  bool discovery_active() const;

  EventChannel<ShareEvent>& events() { return events_; }

  std::vector<PeerRecord> peers() const;
  std::optional<PeerRecord> find_peer(const std::string& name) const;
  void refresh_peers();

  // Uses the credentials remembered for the peer unless others are given.
  ListingResult list_remote(const PeerRecord& peer,
                            const std::string& remote_path,
                            const std::optional<Credentials>& credentials = std::nullopt);
  void remember_credentials(const PeerRecord& peer, const Credentials& credentials);

  // Each path becomes one task; its kind is looked up on the peer.
  bool start_download(const PeerRecord& peer,
                      const std::vector<std::string>& remote_paths,
                      const std::filesystem::path& destination);
  void cancel_download();
  bool download_running() const;
  void wait_for_download();

  // An empty password keeps the stored hash. False when enabling without one.
  bool set_auth(bool enabled, const std::string& username, const std::string& password);
  bool auth_enabled() const;

  std::vector<std::string> local_urls() const;
  const std::filesystem::path& shared_folder() const { return shared_folder_; }
  uint16_t port() const;
  std::string local_service_id() const;

  std::shared_ptr<SettingsManager> settings() const { return settings_; }
  std::shared_ptr<Logger> logger() const { return logger_; }

  LogListenerHandle add_log_listener(Logger::Listener listener, void* user_data = nullptr);
  void remove_log_listener(LogListenerHandle handle);
  void clear_log_listeners();

  struct Stats {
    std::size_t known_peers = 0;
    std::size_t open_connections = 0;
    bool discovery = false;
    bool downloading = false;
  };
  Stats stats() const;

  // Creates `folder` with a short welcome note when it does not exist.
  static bool ensure_shared_folder(const std::filesystem::path& folder,
                                   const std::string& welcome_file,
                                   Logger* logger = nullptr);

  static std::filesystem::path default_shared_folder();

private:
  void start_discovery();
  std::shared_ptr<RemoteShare> make_remote(const PeerRecord& peer) const;
  TransferCallbacks make_transfer_callbacks(const PeerRecord& peer);
  std::optional<Credentials> ask_credentials(const std::string& peer_name);

  std::shared_ptr<SettingsManager> settings_;
  Options options_;
  std::shared_ptr<Logger> logger_;
  std::shared_ptr<Logger> serving_logger_;
  std::shared_ptr<Logger> discovery_logger_;
  std::shared_ptr<Logger> transfer_logger_;

  std::filesystem::path shared_folder_;
  std::shared_ptr<PresenceRegistry> registry_;
  std::unique_ptr<ServingSession> serving_;
  std::shared_ptr<MulticastStack> multicast_;
  std::unique_ptr<DiscoverySession> discovery_;
  EventChannel<ShareEvent> events_;
  bool started_ = false;

  mutable std::mutex transfer_mutex_;
  std::unique_ptr<TransferEngine> transfer_;

  mutable std::mutex credentials_mutex_;
  std::map<std::string, Credentials> peer_credentials_;   // by service id
  std::shared_ptr<CredentialRequest> pending_request_;
};
