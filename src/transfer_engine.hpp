#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "log.hpp"
#include "transfer_progress.hpp"
#include "webdav_client.hpp"

struct TransferTask {
  std::string remote_path;
  std::filesystem::path local_path;   // destination of this item itself
  bool is_directory = false;
  // When set, the parent listing decides whether this is a directory.
  bool detect_kind = false;
  std::string display_name;           // defaults to the remote basename
};

enum class BatchState {
  Idle,
  Listing,
  Downloading,
  AuthRequired,
  Completed,
  Aborted
};

const char* batch_state_name(BatchState state);

struct TransferFailure {
  std::string item_name;
  std::string remote_path;
  std::string reason;
};

struct BatchSummary {
  std::size_t item_count = 0;
  std::size_t files_downloaded = 0;
  uint64_t bytes_downloaded = 0;
  std::vector<TransferFailure> failures;
  bool aborted = false;
  bool cancelled = false;

  // "2 files downloaded (1.5 MB) from 3 items, 1 failed"
  std::string describe() const;
};

struct TransferConfig {
  std::size_t chunk_size = 1024 * 1024;
  std::string peer_name;
  std::optional<Credentials> credentials;
};

// All callbacks run on the thread executing the batch.
struct TransferCallbacks {
  std::function<void(const TransferProgress&)> on_progress;
  std::function<void(BatchState)> on_state;
  std::function<void(const TransferFailure&)> on_failure;
  std::function<void(const std::string& remote_path,
                     const std::filesystem::path& local_path,
                     uint64_t bytes)> on_file_complete;
  std::function<void(const BatchSummary&)> on_complete;
  // Blocks the batch until the user answers; nullopt means cancelled.
  std::function<std::optional<Credentials>(const std::string& peer_name)> on_auth_required;
};

// Replaces path separators and dot names so a listing cannot escape the
// download directory.
std::string sanitize_local_name(const std::string& name);

class TransferEngine {
public:
  TransferEngine(std::shared_ptr<RemoteShare> remote,
                 TransferConfig config,
                 std::shared_ptr<Logger> logger = nullptr,
                 ProgressTracker::NowFn now = {});
  ~TransferEngine();

  TransferEngine(const TransferEngine&) = delete;
  TransferEngine& operator=(const TransferEngine&) = delete;

  // Runs on the calling thread.
  BatchSummary run_batch(std::vector<TransferTask> tasks, TransferCallbacks callbacks);

  // Runs on a worker thread; false while another batch is still running.
  bool start_batch(std::vector<TransferTask> tasks, TransferCallbacks callbacks);
  void wait();

  // Stops at the next chunk or listing boundary.
  void cancel();
  bool busy() const { return busy_.load(); }
  BatchState state() const { return state_.load(); }

  std::optional<Credentials> credentials() const;
  const TransferConfig& config() const { return config_; }

private:
  struct Batch;

  void process_file(Batch& batch, const std::string& remote_path,
                    const std::filesystem::path& local_path, const std::string& name);
  void process_directory(Batch& batch, const std::string& remote_path,
                         const std::filesystem::path& local_path, const std::string& name);
  std::vector<DirectoryEntry> list(Batch& batch, const std::string& remote_path);
  bool detect_directory(Batch& batch, const std::string& remote_path);
  void download(Batch& batch, const std::string& remote_path,
                const std::filesystem::path& local_path, const std::string& name);

  template<typename Request>
  auto with_auth(Batch& batch, const Request& request);

  void set_state(Batch& batch, BatchState state);
  void report_failure(Batch& batch, const std::string& name,
                      const std::string& remote_path, const std::string& reason);
  void check_cancelled() const;

  std::shared_ptr<RemoteShare> remote_;
  TransferConfig config_;
  std::shared_ptr<Logger> logger_;
  ProgressTracker::NowFn now_;

  std::atomic<BatchState> state_{BatchState::Idle};
  std::atomic<bool> cancelled_{false};
  std::atomic<bool> busy_{false};

  mutable std::mutex credentials_mutex_;
  std::optional<Credentials> credentials_;

  std::mutex worker_mutex_;
  std::thread worker_;
};
