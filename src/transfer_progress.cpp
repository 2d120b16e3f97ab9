#include "transfer_progress.hpp"
#include "utils.hpp"

#include <cmath>
#include <sstream>

double TransferProgress::percent() const {
  if(bytes_total == 0) return 0.0;
  return 100.0 * static_cast<double>(bytes_done) / static_cast<double>(bytes_total);
}

std::string TransferProgress::describe() const {
  std::ostringstream oss;
  if(bytes_total > 0) {
    oss.setf(std::ios::fixed);
    oss.precision(1);
    oss << percent() << "% " << format_bytes(bytes_done) << " of " << format_bytes(bytes_total);
  } else {
    oss << format_bytes(bytes_done);
  }
  oss << ", " << format_rate(current_speed_bps)
      << ", ETA " << (eta_seconds ? format_duration(*eta_seconds) : std::string("Calculating..."));
  return oss.str();
}

std::optional<double> estimate_eta(uint64_t bytes_done, uint64_t bytes_total, double speed_bps){
  if(bytes_total == 0 || !(speed_bps > 0.0) || !std::isfinite(speed_bps)) return std::nullopt;
  if(bytes_done >= bytes_total) return 0.0;
  auto eta = static_cast<double>(bytes_total - bytes_done) / speed_bps;
  if(!std::isfinite(eta) || eta >= ProgressTracker::kMaxEtaSeconds) return std::nullopt;
  return eta;
}

ProgressTracker::ProgressTracker(NowFn now)
  : now_(now ? std::move(now) : NowFn([](){ return Clock::now(); }))
{}

void ProgressTracker::begin(const std::string& item_name, const std::string& remote_path, uint64_t bytes_total){
  progress_ = TransferProgress{};
  progress_.item_name = item_name;
  progress_.remote_path = remote_path;
  progress_.bytes_total = bytes_total;
  progress_.started_at = now_();
}

void ProgressTracker::set_total(uint64_t bytes_total){
  progress_.bytes_total = bytes_total;
  recompute();
}

const TransferProgress& ProgressTracker::advance(uint64_t bytes){
  progress_.bytes_done += bytes;
  recompute();
  return progress_;
}

void ProgressTracker::recompute(){
  std::chrono::duration<double> elapsed = now_() - progress_.started_at;
  if(elapsed.count() < kMinElapsedSeconds) {
    progress_.current_speed_bps = 0.0;
    progress_.eta_seconds.reset();
    return;
  }
  progress_.current_speed_bps = static_cast<double>(progress_.bytes_done) / elapsed.count();
  progress_.eta_seconds = estimate_eta(progress_.bytes_done, progress_.bytes_total, progress_.current_speed_bps);
}

bool ProgressThrottle::admit(const TransferProgress& progress, Clock::time_point now){
  bool finished = progress.bytes_total > 0 && progress.bytes_done >= progress.bytes_total;
  if(!finished && last_ && now - *last_ < interval_) {
    pending_ = progress;
    return false;
  }
  last_ = now;
  pending_.reset();
  return true;
}

std::optional<TransferProgress> ProgressThrottle::take_pending(){
  auto pending = std::move(pending_);
  pending_.reset();
  return pending;
}
