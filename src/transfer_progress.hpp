#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

struct TransferProgress {
  std::string item_name;
  std::string remote_path;
  uint64_t bytes_done = 0;
  uint64_t bytes_total = 0;      // 0 when the server sent no length
  std::chrono::steady_clock::time_point started_at;
  double current_speed_bps = 0.0;
  std::optional<double> eta_seconds;  // nullopt: unbounded / not yet known

  double percent() const;
  // "42.0% 1.5 MB of 3.6 MB, 1.20 MB/s, ETA 2s"
  std::string describe() const;
};

// Speed and ETA for one file. The clock is injectable for tests.
class ProgressTracker {
public:
  using Clock = std::chrono::steady_clock;
  using NowFn = std::function<Clock::time_point()>;

  static constexpr double kMinElapsedSeconds = 0.1;
  static constexpr double kMaxEtaSeconds = 36000.0;

  explicit ProgressTracker(NowFn now = {});

  void begin(const std::string& item_name, const std::string& remote_path, uint64_t bytes_total);
  void set_total(uint64_t bytes_total);
  const TransferProgress& advance(uint64_t bytes);
  const TransferProgress& current() const { return progress_; }

private:
  void recompute();

  NowFn now_;
  TransferProgress progress_;
};

// ETA from remaining bytes and speed; nullopt when it cannot be bounded.
std::optional<double> estimate_eta(uint64_t bytes_done, uint64_t bytes_total, double speed_bps);

// Rate-limits progress reports. A completed known-length file always passes;
// the newest update held back is kept until take_pending().
class ProgressThrottle {
public:
  using Clock = std::chrono::steady_clock;

  explicit ProgressThrottle(std::chrono::milliseconds interval) : interval_(interval) {}

  bool admit(const TransferProgress& progress, Clock::time_point now = Clock::now());
  std::optional<TransferProgress> take_pending();

private:
  std::chrono::milliseconds interval_;
  std::optional<Clock::time_point> last_;
  std::optional<TransferProgress> pending_;
};
