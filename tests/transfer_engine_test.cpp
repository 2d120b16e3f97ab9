#include "transfer_engine.hpp"
#include "share_errors.hpp"
#include "test_runner_utils.hpp"
#include "utils.hpp"

#include <future>
#include <map>
#include <mutex>
#include <set>
#include <vector>

namespace {

using share::test::TempDir;
using share::test::TestCase;
using share::test::TestContext;
using share::test::read_file;
namespace fs = std::filesystem;

// Serves a fixed tree from memory and counts every request it sees.
class ScriptedShare : public RemoteShare {
public:
  void add_file(const std::string& path, const std::string& content) {
    files_[path] = content;
    auto slash = path.find_last_of('/');
    auto parent = slash == std::string::npos ? std::string() : path.substr(0, slash);
    add_entry(parent, {remote_basename(path), false, content.size(), "", "application/octet-stream", path});
  }

  void add_dir(const std::string& path) {
    dirs_[path];
    auto slash = path.find_last_of('/');
    auto parent = slash == std::string::npos ? std::string() : path.substr(0, slash);
    add_entry(parent, {remote_basename(path), true, 0, "", "", path});
  }

  ListingResult list_directory(const std::string& remote_path,
                               const std::optional<Credentials>& credentials) override {
    auto path = normalize_remote_path(remote_path);
    ListingResult result;
    {
      std::lock_guard lg(m_);
      list_requests_[path]++;
    }
    if(!authorized(credentials)) {
      result.status = 401;
      return result;
    }
    if(failing_listings.count(path)) {
      result.status = 500;
      return result;
    }
    auto it = dirs_.find(path);
    if(it == dirs_.end()) {
      result.status = 404;
      return result;
    }
    result.status = 207;
    result.entries = it->second;
    return result;
  }

  FetchResult fetch_file(const std::string& remote_path,
                         const std::optional<Credentials>& credentials,
                         const FetchCallbacks& callbacks,
                         std::size_t chunk_size) override {
    auto path = normalize_remote_path(remote_path);
    FetchResult result;
    {
      std::lock_guard lg(m_);
      fetch_requests_[path]++;
    }
    if(!authorized(credentials)) {
      result.status = 401;
      result.error = "HTTP 401";
      return result;
    }
    auto it = files_.find(path);
    if(it == files_.end() || failing_fetches.count(path)) {
      result.status = it == files_.end() ? 404 : 500;
      result.error = "HTTP " + std::to_string(result.status);
      return result;
    }
    result.status = 200;
    const auto& content = it->second;
    if(callbacks.on_start) callbacks.on_start(content.size());
    for(std::size_t offset = 0; offset < content.size(); offset += chunk_size) {
      auto size = std::min(chunk_size, content.size() - offset);
      if(truncate_after && offset >= *truncate_after) break;
      if(offset > 0 && dropped_fetches.count(path)) {
        // the peer went away after the first chunk
        result.status = 0;
        result.error = "connection reset";
        return result;
      }
      if(callbacks.on_chunk && !callbacks.on_chunk(content.data() + offset, size)) {
        result.stopped = true;
        return result;
      }
      result.bytes += size;
    }
    return result;
  }

  int lists_of(const std::string& path) {
    std::lock_guard lg(m_);
    return list_requests_[path];
  }

  int fetches_of(const std::string& path) {
    std::lock_guard lg(m_);
    return fetch_requests_[path];
  }

  std::optional<Credentials> required;
  std::set<std::string> failing_listings;
  std::set<std::string> failing_fetches;
  std::set<std::string> dropped_fetches;
  std::optional<std::size_t> truncate_after;

private:
  bool authorized(const std::optional<Credentials>& credentials) const {
    if(!required) return true;
    return credentials && credentials->username == required->username &&
           credentials->password == required->password;
  }

  void add_entry(const std::string& parent, DirectoryEntry entry) {
    dirs_[parent].push_back(std::move(entry));
  }

  std::map<std::string, std::string> files_;
  std::map<std::string, std::vector<DirectoryEntry>> dirs_;
  std::mutex m_;
  std::map<std::string, int> list_requests_;
  std::map<std::string, int> fetch_requests_;
};

TransferTask file_task(const std::string& remote, const fs::path& local) {
  TransferTask task;
  task.remote_path = remote;
  task.local_path = local;
  return task;
}

TransferTask detect_task(const std::string& remote, const fs::path& local) {
  TransferTask task = file_task(remote, local);
  task.detect_kind = true;
  return task;
}

TransferConfig config_for(std::size_t chunk_size = 4) {
  TransferConfig config;
  config.chunk_size = chunk_size;
  config.peer_name = "nas";
  return config;
}

bool test_partial_batch_failure(TestContext& ctx) {
  TempDir dir("partial_batch");
  auto share = std::make_shared<ScriptedShare>();
  share->add_file("one.txt", "first file");
  share->add_file("two.txt", "second file");
  share->add_file("three.txt", "third file");
  share->failing_fetches.insert("two.txt");

  auto logger = std::make_shared<Logger>("transfer");
  ctx.logs.attach(logger);
  TransferEngine engine(share, config_for(), logger);

  std::vector<TransferFailure> failures;
  bool completed = false;
  TransferCallbacks callbacks;
  callbacks.on_failure = [&](const TransferFailure& f){ failures.push_back(f); };
  callbacks.on_complete = [&](const BatchSummary&){ completed = true; };

  auto summary = engine.run_batch({
    file_task("one.txt", dir.path() / "one.txt"),
    file_task("two.txt", dir.path() / "two.txt"),
    file_task("three.txt", dir.path() / "three.txt")
  }, callbacks);

  return completed &&
         summary.item_count == 3 && summary.files_downloaded == 2 &&
         summary.failures.size() == 1 && summary.failures[0].item_name == "two.txt" &&
         failures.size() == 1 && failures[0].reason == "HTTP 500" &&
         !summary.aborted &&
         read_file(dir.path() / "one.txt") == "first file" &&
         read_file(dir.path() / "three.txt") == "third file" &&
         !fs::exists(dir.path() / "two.txt") &&
         engine.state() == BatchState::Completed &&
         summary.describe() == "2 files downloaded (20.0 B) from 3 items, 1 failed";
}

bool test_network_failure_mid_batch(TestContext&) {
  TempDir dir("network_batch");
  auto share = std::make_shared<ScriptedShare>();
  share->add_file("one.txt", "first file");
  share->add_file("two.txt", std::string(64, '2'));
  share->add_file("three.txt", "third file");
  share->dropped_fetches.insert("two.txt");

  auto config = config_for();
  config.chunk_size = 16;
  TransferEngine engine(share, config);

  uint64_t two_bytes_seen = 0;
  TransferCallbacks callbacks;
  callbacks.on_progress = [&](const TransferProgress& p){
    if(p.remote_path == "two.txt") two_bytes_seen = p.bytes_done;
  };

  auto summary = engine.run_batch({
    file_task("one.txt", dir.path() / "one.txt"),
    file_task("two.txt", dir.path() / "two.txt"),
    file_task("three.txt", dir.path() / "three.txt")
  }, callbacks);

  return summary.files_downloaded == 2 &&
         summary.failures.size() == 1 && summary.failures[0].item_name == "two.txt" &&
         summary.failures[0].reason == "connection reset" &&
         two_bytes_seen == 16 &&
         !fs::exists(dir.path() / "two.txt") &&
         read_file(dir.path() / "one.txt") == "first file" &&
         read_file(dir.path() / "three.txt") == "third file" &&
         engine.state() == BatchState::Completed;
}

bool test_directory_recursion(TestContext&) {
  TempDir dir("recursion");
  auto share = std::make_shared<ScriptedShare>();
  share->add_dir("photos");
  share->add_file("photos/one.jpg", "jpeg-one");
  share->add_dir("photos/sub");
  share->add_file("photos/sub/two.jpg", "jpeg-two");

  TransferEngine engine(share, config_for());
  auto summary = engine.run_batch({detect_task("photos", dir.path() / "photos")}, {});

  return summary.files_downloaded == 2 && summary.failures.empty() &&
         read_file(dir.path() / "photos" / "one.jpg") == "jpeg-one" &&
         read_file(dir.path() / "photos" / "sub" / "two.jpg") == "jpeg-two" &&
         share->fetches_of("photos/sub/two.jpg") == 1 &&
         share->lists_of("photos/sub") == 1;
}

bool test_whole_share(TestContext&) {
  TempDir dir("whole_share");
  auto share = std::make_shared<ScriptedShare>();
  share->add_file("readme.txt", "hello");
  share->add_dir("docs");
  share->add_file("docs/a.txt", "a");

  TransferEngine engine(share, config_for());
  TransferTask task = detect_task("", dir.path() / "nas");
  task.display_name = "nas";
  auto summary = engine.run_batch({task}, {});
  return summary.files_downloaded == 2 &&
         read_file(dir.path() / "nas" / "readme.txt") == "hello" &&
         read_file(dir.path() / "nas" / "docs" / "a.txt") == "a";
}

bool test_subdirectory_listing_failure(TestContext&) {
  TempDir dir("listing_failure");
  auto share = std::make_shared<ScriptedShare>();
  share->add_dir("music");
  share->add_dir("music/broken");
  share->add_file("music/broken/x.mp3", "x");
  share->add_file("music/ok.mp3", "ok");
  share->failing_listings.insert("music/broken");

  TransferEngine engine(share, config_for());
  TransferTask task;
  task.remote_path = "music";
  task.local_path = dir.path() / "music";
  task.is_directory = true;
  auto summary = engine.run_batch({task}, {});

  return summary.files_downloaded == 1 && summary.failures.size() == 1 &&
         summary.failures[0].item_name == "broken" &&
         summary.failures[0].reason == "could not list contents: HTTP 500" &&
         read_file(dir.path() / "music" / "ok.mp3") == "ok";
}

bool test_progress_monotonic(TestContext&) {
  TempDir dir("progress");
  auto share = std::make_shared<ScriptedShare>();
  share->add_file("big.bin", std::string(37, 'z'));

  TransferEngine engine(share, config_for(5));
  std::vector<uint64_t> seen;
  uint64_t total = 0;
  TransferCallbacks callbacks;
  callbacks.on_progress = [&](const TransferProgress& p){
    seen.push_back(p.bytes_done);
    total = p.bytes_total;
  };
  auto summary = engine.run_batch({file_task("big.bin", dir.path() / "big.bin")}, callbacks);
  if(seen.empty()) return false;
  for(std::size_t i = 1; i < seen.size(); ++i) {
    if(seen[i] < seen[i - 1]) return false;
  }
  return summary.files_downloaded == 1 && seen.back() == 37 && total == 37 &&
         summary.bytes_downloaded == 37;
}

bool test_auth_retry_once(TestContext&) {
  TempDir dir("auth_retry");
  auto share = std::make_shared<ScriptedShare>();
  share->add_dir("docs");
  share->add_file("docs/readme.txt", "secret");
  share->required = Credentials{"alice", "pw"};

  TransferEngine engine(share, config_for());
  int prompts = 0;
  std::vector<BatchState> states;
  TransferCallbacks callbacks;
  callbacks.on_state = [&](BatchState s){ states.push_back(s); };
  callbacks.on_auth_required = [&](const std::string& peer) -> std::optional<Credentials> {
    ++prompts;
    if(peer != "nas") return std::nullopt;
    return Credentials{"alice", "pw"};
  };
  auto summary = engine.run_batch({detect_task("docs/readme.txt", dir.path() / "readme.txt")}, callbacks);

  auto creds = engine.credentials();
  bool saw_auth = std::find(states.begin(), states.end(), BatchState::AuthRequired) != states.end();
  return prompts == 1 && saw_auth &&
         share->lists_of("docs") == 2 &&
         share->fetches_of("docs/readme.txt") == 1 &&
         summary.files_downloaded == 1 && summary.failures.empty() &&
         creds && creds->username == "alice" &&
         read_file(dir.path() / "readme.txt") == "secret";
}

bool test_auth_cancel_aborts(TestContext&) {
  TempDir dir("auth_cancel");
  auto share = std::make_shared<ScriptedShare>();
  share->add_file("a.txt", "a");
  share->add_file("b.txt", "b");
  share->required = Credentials{"alice", "pw"};

  TransferEngine engine(share, config_for());
  int prompts = 0;
  TransferCallbacks callbacks;
  callbacks.on_auth_required = [&](const std::string&) -> std::optional<Credentials> {
    ++prompts;
    return std::nullopt;
  };
  auto summary = engine.run_batch({
    file_task("a.txt", dir.path() / "a.txt"),
    file_task("b.txt", dir.path() / "b.txt")
  }, callbacks);

  return prompts == 1 &&
         share->fetches_of("a.txt") == 1 &&
         share->fetches_of("b.txt") == 0 &&
         summary.aborted && !summary.cancelled &&
         summary.failures.size() == 2 &&
         summary.failures[1].reason == summary.failures[0].reason &&
         engine.state() == BatchState::Aborted &&
         !fs::exists(dir.path() / "a.txt");
}

bool test_auth_rejected_again(TestContext&) {
  TempDir dir("auth_rejected");
  auto share = std::make_shared<ScriptedShare>();
  share->add_file("a.txt", "a");
  share->required = Credentials{"alice", "pw"};

  TransferEngine engine(share, config_for());
  TransferCallbacks callbacks;
  callbacks.on_auth_required = [&](const std::string&) -> std::optional<Credentials> {
    return Credentials{"alice", "wrong"};
  };
  auto summary = engine.run_batch({file_task("a.txt", dir.path() / "a.txt")}, callbacks);
  return share->fetches_of("a.txt") == 2 && summary.aborted &&
         summary.failures.size() == 1 &&
         summary.failures[0].reason.find("rejected") != std::string::npos &&
         !engine.credentials();
}

bool test_stored_credentials_used(TestContext&) {
  TempDir dir("stored_credentials");
  auto share = std::make_shared<ScriptedShare>();
  share->add_file("a.txt", "a");
  share->required = Credentials{"alice", "pw"};

  auto config = config_for();
  config.credentials = Credentials{"alice", "pw"};
  TransferEngine engine(share, config);
  int prompts = 0;
  TransferCallbacks callbacks;
  callbacks.on_auth_required = [&](const std::string&) -> std::optional<Credentials> {
    ++prompts;
    return std::nullopt;
  };
  auto summary = engine.run_batch({file_task("a.txt", dir.path() / "a.txt")}, callbacks);
  return prompts == 0 && summary.files_downloaded == 1 && share->fetches_of("a.txt") == 1;
}

bool test_cancel_removes_partial(TestContext&) {
  TempDir dir("cancel");
  auto share = std::make_shared<ScriptedShare>();
  share->add_file("big.bin", std::string(64, 'q'));
  share->add_file("next.bin", "n");

  TransferEngine engine(share, config_for(8));
  TransferCallbacks callbacks;
  callbacks.on_progress = [&](const TransferProgress& p){
    if(p.bytes_done >= 16) engine.cancel();
  };
  auto summary = engine.run_batch({
    file_task("big.bin", dir.path() / "big.bin"),
    file_task("next.bin", dir.path() / "next.bin")
  }, callbacks);

  return summary.cancelled && summary.aborted && summary.files_downloaded == 0 &&
         summary.failures.size() == 2 &&
         !fs::exists(dir.path() / "big.bin") &&
         share->fetches_of("next.bin") == 0 &&
         engine.state() == BatchState::Aborted;
}

bool test_truncated_body(TestContext&) {
  TempDir dir("truncated");
  auto share = std::make_shared<ScriptedShare>();
  share->add_file("cut.bin", std::string(20, 'c'));
  share->truncate_after = 8;

  TransferEngine engine(share, config_for(4));
  auto summary = engine.run_batch({file_task("cut.bin", dir.path() / "cut.bin")}, {});
  return summary.files_downloaded == 0 && summary.failures.size() == 1 &&
         summary.failures[0].reason.find("incomplete download") != std::string::npos &&
         !fs::exists(dir.path() / "cut.bin");
}

bool test_missing_item(TestContext&) {
  TempDir dir("missing");
  auto share = std::make_shared<ScriptedShare>();
  share->add_file("present.txt", "p");

  TransferEngine engine(share, config_for());
  auto summary = engine.run_batch({detect_task("absent.txt", dir.path() / "absent.txt")}, {});
  return summary.failures.size() == 1 &&
         summary.failures[0].reason == "not found on nas" &&
         !summary.aborted;
}

bool test_background_batch_is_exclusive(TestContext&) {
  TempDir dir("exclusive");
  auto share = std::make_shared<ScriptedShare>();
  share->add_file("a.txt", "a");
  share->required = Credentials{"alice", "pw"};

  TransferEngine engine(share, config_for());
  std::promise<void> prompted;
  std::promise<std::optional<Credentials>> answer;
  auto answer_future = answer.get_future();
  std::promise<BatchSummary> finished;
  auto finished_future = finished.get_future();

  TransferCallbacks callbacks;
  callbacks.on_auth_required = [&](const std::string&) {
    prompted.set_value();
    return answer_future.get();
  };
  callbacks.on_complete = [&](const BatchSummary& summary){ finished.set_value(summary); };

  if(!engine.start_batch({file_task("a.txt", dir.path() / "a.txt")}, callbacks)) return false;
  prompted.get_future().wait();
  bool busy = engine.busy() && engine.state() == BatchState::AuthRequired;
  bool second = engine.start_batch({file_task("a.txt", dir.path() / "b.txt")}, {});
  answer.set_value(Credentials{"alice", "pw"});
  engine.wait();

  auto summary = finished_future.get();
  return busy && !second && !engine.busy() && summary.files_downloaded == 1 &&
         read_file(dir.path() / "a.txt") == "a";
}

bool test_sanitize_local_name(TestContext&) {
  return sanitize_local_name("../etc/passwd") == ".._etc_passwd" &&
         sanitize_local_name("..") == "_" &&
         sanitize_local_name(".") == "_" &&
         sanitize_local_name("") == "_" &&
         sanitize_local_name("a\\b") == "a_b" &&
         sanitize_local_name("Song One.mp3") == "Song One.mp3";
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"partial_batch_failure", test_partial_batch_failure},
    {"network_failure_mid_batch", test_network_failure_mid_batch},
    {"directory_recursion", test_directory_recursion},
    {"whole_share", test_whole_share},
    {"subdirectory_listing_failure", test_subdirectory_listing_failure},
    {"progress_monotonic", test_progress_monotonic},
    {"auth_retry_once", test_auth_retry_once},
    {"auth_cancel_aborts", test_auth_cancel_aborts},
    {"auth_rejected_again", test_auth_rejected_again},
    {"stored_credentials_used", test_stored_credentials_used},
    {"cancel_removes_partial", test_cancel_removes_partial},
    {"truncated_body", test_truncated_body},
    {"missing_item", test_missing_item},
    {"background_batch_is_exclusive", test_background_batch_is_exclusive},
    {"sanitize_local_name", test_sanitize_local_name}
  };
  return share::test::run_test_cases("transfer engine", tests, argc, argv);
}
