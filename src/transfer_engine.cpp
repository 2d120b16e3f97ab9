#include "transfer_engine.hpp"
#include "share_errors.hpp"
#include "utils.hpp"

#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace {

// Thrown inside a batch when cancel() was requested.
struct BatchCancelled {};

// Removes a partially written file unless the download completed.
class PartialFile {
public:
  explicit PartialFile(fs::path path) : path_(std::move(path)) {}
  ~PartialFile(){
    if(!armed_) return;
    std::error_code ec;
    fs::remove(path_, ec);
  }
  void arm() { armed_ = true; }
  void keep() { armed_ = false; }

private:
  fs::path path_;
  bool armed_ = false;
};

std::string item_name_for(const TransferTask& task){
  if(!task.display_name.empty()) return task.display_name;
  auto base = remote_basename(task.remote_path);
  return base.empty() ? std::string("/") : base;
}

} // namespace

const char* batch_state_name(BatchState state){
  switch(state) {
    case BatchState::Idle: return "idle";
    case BatchState::Listing: return "listing";
    case BatchState::Downloading: return "downloading";
    case BatchState::AuthRequired: return "auth-required";
    case BatchState::Completed: return "completed";
    case BatchState::Aborted: return "aborted";
  }
  return "unknown";
}

std::string BatchSummary::describe() const {
  std::ostringstream oss;
  auto failed_items = failures.size();
  oss << files_downloaded << " file" << (files_downloaded == 1 ? "" : "s")
      << " downloaded (" << format_bytes(bytes_downloaded) << ") from "
      << item_count << " item" << (item_count == 1 ? "" : "s");
  if(failed_items > 0) oss << ", " << failed_items << " failed";
  if(cancelled) {
    oss << ", cancelled";
  } else if(aborted) {
    oss << ", aborted";
  }
  return oss.str();
}

std::string sanitize_local_name(const std::string& name){
  std::string out;
  out.reserve(name.size());
  for(char c : name) {
    out.push_back(c == '/' || c == '\\' || c == '\0' ? '_' : c);
  }
  out = trim_copy(out);
  if(out.empty() || out == "." || out == "..") return "_";
  return out;
}

struct TransferEngine::Batch {
  TransferCallbacks callbacks;
  BatchSummary summary;
  ProgressTracker tracker;

  explicit Batch(TransferCallbacks cb, ProgressTracker::NowFn now)
    : callbacks(std::move(cb)), tracker(std::move(now)) {}
};

TransferEngine::TransferEngine(std::shared_ptr<RemoteShare> remote,
                               TransferConfig config,
                               std::shared_ptr<Logger> logger,
                               ProgressTracker::NowFn now)
  : remote_(std::move(remote)),
    config_(std::move(config)),
    logger_(std::move(logger)),
    now_(std::move(now)),
    credentials_(config_.credentials)
{
  if(config_.chunk_size == 0) config_.chunk_size = 1024 * 1024;
}

TransferEngine::~TransferEngine(){
  cancel();
  wait();
}

std::optional<Credentials> TransferEngine::credentials() const {
  std::lock_guard lg(credentials_mutex_);
  return credentials_;
}

void TransferEngine::cancel(){
  if(busy_.load()) cancelled_.store(true);
}

void TransferEngine::check_cancelled() const {
  if(cancelled_.load()) throw BatchCancelled{};
}

bool TransferEngine::start_batch(std::vector<TransferTask> tasks, TransferCallbacks callbacks){
  std::lock_guard lg(worker_mutex_);
  if(busy_.load()) return false;
  if(worker_.joinable()) worker_.join();
  busy_.store(true);
  worker_ = std::thread([this, tasks = std::move(tasks), callbacks = std::move(callbacks)]() mutable {
    try {
      run_batch(std::move(tasks), std::move(callbacks));
    } catch(const std::exception& e) {
      log_error(logger_.get(), "Transfer batch failed: {}", e.what());
      state_.store(BatchState::Aborted);
      busy_.store(false);
    }
  });
  return true;
}

void TransferEngine::wait(){
  std::lock_guard lg(worker_mutex_);
  if(worker_.joinable()) worker_.join();
}

void TransferEngine::set_state(Batch& batch, BatchState state){
  state_.store(state);
  if(batch.callbacks.on_state) batch.callbacks.on_state(state);
}

void TransferEngine::report_failure(Batch& batch, const std::string& name,
                                    const std::string& remote_path, const std::string& reason){
  TransferFailure failure{name, remote_path, reason};
  log_warn(logger_.get(), "{}: {}", name, reason);
  batch.summary.failures.push_back(failure);
  if(batch.callbacks.on_failure) batch.callbacks.on_failure(failure);
}

template<typename Request>
auto TransferEngine::with_auth(Batch& batch, const Request& request){
  auto result = request(credentials());
  if(result.status != 401) return result;

  auto resume = state_.load();
  set_state(batch, BatchState::AuthRequired);
  log_info(logger_.get(), "{} requires authentication", config_.peer_name);
  std::optional<Credentials> supplied;
  if(batch.callbacks.on_auth_required) supplied = batch.callbacks.on_auth_required(config_.peer_name);
  if(!supplied) {
    throw AuthFailure("authentication cancelled for " + config_.peer_name);
  }
  result = request(supplied);
  if(result.status == 401) {
    throw AuthFailure("credentials rejected by " + config_.peer_name);
  }
  {
    std::lock_guard lg(credentials_mutex_);
    credentials_ = supplied;
  }
  set_state(batch, resume);
  return result;
}

std::vector<DirectoryEntry> TransferEngine::list(Batch& batch, const std::string& remote_path){
  check_cancelled();
  set_state(batch, BatchState::Listing);
  auto result = with_auth(batch, [&](const std::optional<Credentials>& creds){
    return remote_->list_directory(remote_path, creds);
  });
  if(result.status != 207) {
    auto reason = result.error.empty() ? "HTTP " + std::to_string(result.status) : result.error;
    throw ListingError(remote_path, reason, result.status);
  }
  return std::move(result.entries);
}

bool TransferEngine::detect_directory(Batch& batch, const std::string& remote_path){
  auto normalized = normalize_remote_path(remote_path);
  if(normalized.empty()) return true;
  auto slash = normalized.find_last_of('/');
  auto parent = slash == std::string::npos ? std::string() : normalized.substr(0, slash);
  for(const auto& entry : list(batch, parent)) {
    if(entry.remote_path == normalized) return entry.is_directory;
  }
  throw TransferError(remote_path, "not found on " + config_.peer_name, 404);
}

void TransferEngine::download(Batch& batch, const std::string& remote_path,
                              const fs::path& local_path, const std::string& name){
  check_cancelled();
  set_state(batch, BatchState::Downloading);

  std::error_code ec;
  if(local_path.has_parent_path()) {
    fs::create_directories(local_path.parent_path(), ec);
    if(ec) throw TransferError(remote_path, "cannot create " + local_path.parent_path().string() + ": " + ec.message());
  }

  PartialFile partial(local_path);
  std::ofstream out;
  batch.tracker.begin(name, remote_path, 0);

  FetchCallbacks fetch;
  fetch.on_start = [&](uint64_t total){
    batch.tracker.set_total(total);
    out.open(local_path, std::ios::binary | std::ios::trunc);
    if(!out) throw TransferError(remote_path, "cannot open " + local_path.string() + " for writing");
    partial.arm();
    if(batch.callbacks.on_progress) batch.callbacks.on_progress(batch.tracker.current());
  };
  fetch.on_chunk = [&](const char* data, std::size_t size){
    if(cancelled_.load()) return false;
    out.write(data, static_cast<std::streamsize>(size));
    if(!out) throw TransferError(remote_path, "write to " + local_path.string() + " failed");
    const auto& progress = batch.tracker.advance(size);
    if(batch.callbacks.on_progress) batch.callbacks.on_progress(progress);
    return true;
  };

  auto result = with_auth(batch, [&](const std::optional<Credentials>& creds){
    return remote_->fetch_file(remote_path, creds, fetch, config_.chunk_size);
  });
  if(result.stopped) throw BatchCancelled{};
  if(!result.error.empty()) throw TransferError(remote_path, result.error, result.status);

  const auto& progress = batch.tracker.current();
  if(progress.bytes_total > 0 && progress.bytes_done != progress.bytes_total) {
    throw TransferError(remote_path, "incomplete download: " + std::to_string(progress.bytes_done) +
                        " of " + std::to_string(progress.bytes_total) + " bytes");
  }
  out.close();
  if(!out) throw TransferError(remote_path, "closing " + local_path.string() + " failed");
  partial.keep();

  batch.summary.files_downloaded++;
  batch.summary.bytes_downloaded += progress.bytes_done;
  log_info(logger_.get(), "Downloaded {} ({})", local_path.string(), format_bytes(progress.bytes_done));
  if(batch.callbacks.on_file_complete) {
    batch.callbacks.on_file_complete(remote_path, local_path, progress.bytes_done);
  }
}

void TransferEngine::process_file(Batch& batch, const std::string& remote_path,
                                  const fs::path& local_path, const std::string& name){
  try {
    download(batch, remote_path, local_path, name);
  } catch(const TransferError& e) {
    report_failure(batch, name, e.remote_path(), e.what());
  }
}

void TransferEngine::process_directory(Batch& batch, const std::string& remote_path,
                                       const fs::path& local_path, const std::string& name){
  std::vector<DirectoryEntry> entries;
  try {
    entries = list(batch, remote_path);
  } catch(const ListingError& e) {
    report_failure(batch, name, remote_path, std::string("could not list contents: ") + e.what());
    return;
  }

  std::error_code ec;
  fs::create_directories(local_path, ec);
  if(ec) {
    report_failure(batch, name, remote_path, "cannot create " + local_path.string() + ": " + ec.message());
    return;
  }
  log_debug(logger_.get(), "{}: {} entries", remote_path.empty() ? "/" : remote_path, entries.size());

  for(const auto& entry : entries) {
    check_cancelled();
    auto child_local = local_path / sanitize_local_name(entry.name);
    if(entry.is_directory) {
      process_directory(batch, entry.remote_path, child_local, entry.name);
    } else {
      process_file(batch, entry.remote_path, child_local, entry.name);
    }
  }
}

BatchSummary TransferEngine::run_batch(std::vector<TransferTask> tasks, TransferCallbacks callbacks){
  busy_.store(true);
  Batch batch(std::move(callbacks), now_);
  batch.summary.item_count = tasks.size();
  set_state(batch, BatchState::Idle);
  log_info(logger_.get(), "Starting batch of {} item(s) from {}", tasks.size(), config_.peer_name);

  std::string abort_reason;
  for(const auto& task : tasks) {
    auto name = item_name_for(task);
    if(batch.summary.aborted) {
      report_failure(batch, name, task.remote_path, abort_reason);
      continue;
    }
    try {
      check_cancelled();
      bool is_directory = task.detect_kind ? detect_directory(batch, task.remote_path) : task.is_directory;
      if(is_directory) {
        process_directory(batch, task.remote_path, task.local_path, name);
      } else {
        process_file(batch, task.remote_path, task.local_path, name);
      }
    } catch(const ListingError& e) {
      report_failure(batch, name, task.remote_path, std::string("could not inspect: ") + e.what());
    } catch(const TransferError& e) {
      report_failure(batch, name, task.remote_path, e.what());
    } catch(const AuthFailure& e) {
      batch.summary.aborted = true;
      abort_reason = e.what();
      report_failure(batch, name, task.remote_path, abort_reason);
    } catch(const BatchCancelled&) {
      batch.summary.aborted = true;
      batch.summary.cancelled = true;
      abort_reason = "cancelled";
      report_failure(batch, name, task.remote_path, abort_reason);
    }
  }

  set_state(batch, batch.summary.aborted ? BatchState::Aborted : BatchState::Completed);
  log_info(logger_.get(), "Batch finished: {}", batch.summary.describe());
  if(batch.callbacks.on_complete) batch.callbacks.on_complete(batch.summary);
  cancelled_.store(false);
  busy_.store(false);
  return batch.summary;
}
