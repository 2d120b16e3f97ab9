#include "log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <atomic>
#include <mutex>
#include <vector>

namespace {

constexpr const char* kStampedPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

struct DefaultSinks {
  std::shared_ptr<spdlog::logger> log;       // info/warn/debug -> stdout
  std::shared_ptr<spdlog::logger> error;     // error -> stderr
  std::shared_ptr<spdlog::logger> print;     // plain stdout
  std::shared_ptr<spdlog::logger> print_err; // plain stderr
  std::shared_ptr<spdlog::sinks::basic_file_sink_mt> file;
  std::filesystem::path file_path;
};

std::mutex g_sinks_mutex;
DefaultSinks g_sinks;
std::atomic<bool> g_log_passthrough{true};

std::shared_ptr<spdlog::logger> make_logger(const std::string& name,
                                            spdlog::sink_ptr sink,
                                            spdlog::level::level_enum flush_level) {
  auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
  logger->flush_on(flush_level);
  return logger;
}

void create_loggers_locked() {
  if(g_sinks.log) return;

  auto out_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  out_sink->set_pattern(kStampedPattern);
  auto err_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  err_sink->set_pattern(kStampedPattern);
  auto plain_out = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  plain_out->set_pattern("%v");
  auto plain_err = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  plain_err->set_pattern("%v");

  g_sinks.log = make_logger("lanshare.log", std::move(out_sink), spdlog::level::warn);
  g_sinks.error = make_logger("lanshare.error", std::move(err_sink), spdlog::level::err);
  g_sinks.print = make_logger("lanshare.print", std::move(plain_out), spdlog::level::info);
  g_sinks.print_err = make_logger("lanshare.print_err", std::move(plain_err), spdlog::level::err);
}

// The file sink only receives the stamped log lines, not plain prints.
void attach_file_sink_locked(const std::filesystem::path& path) {
  if(path.empty() || path == g_sinks.file_path) return;
  std::error_code ec;
  if(path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path.string(), false);
  sink->set_pattern(kStampedPattern);
  for(auto* target : {&g_sinks.log, &g_sinks.error}) {
    auto& sinks = (*target)->sinks();
    if(g_sinks.file) {
      sinks.erase(std::remove(sinks.begin(), sinks.end(), g_sinks.file), sinks.end());
    }
    sinks.push_back(sink);
  }
  g_sinks.file = std::move(sink);
  g_sinks.file_path = path;
}

spdlog::logger* sink_for(LogChannel channel) {
  std::lock_guard<std::mutex> lock(g_sinks_mutex);
  create_loggers_locked();
  switch(channel) {
    case LogChannel::Print: return g_sinks.print.get();
    case LogChannel::PrintErr: return g_sinks.print_err.get();
    case LogChannel::Error: return g_sinks.error.get();
    default: return g_sinks.log.get();
  }
}

} // namespace

const char* channel_label(LogChannel channel) {
  switch(channel) {
    case LogChannel::Info: return "info";
    case LogChannel::Warn: return "warn";
    case LogChannel::Error: return "error";
    case LogChannel::Debug: return "debug";
    case LogChannel::Print: return "print";
    case LogChannel::PrintErr: return "print_err";
  }
  return "info";
}

spdlog::level::level_enum channel_level(LogChannel channel) {
  switch(channel) {
    case LogChannel::Warn: return spdlog::level::warn;
    case LogChannel::Error:
    case LogChannel::PrintErr: return spdlog::level::err;
    case LogChannel::Debug: return spdlog::level::debug;
    default: return spdlog::level::info;
  }
}

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

void init(bool verbose, const std::filesystem::path& log_file) {
  std::lock_guard<std::mutex> lock(g_sinks_mutex);
  create_loggers_locked();

  auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  g_sinks.log->set_level(level);
  g_sinks.error->set_level(spdlog::level::info);
  g_sinks.print->set_level(spdlog::level::info);
  g_sinks.print_err->set_level(spdlog::level::info);

  try {
    attach_file_sink_locked(log_file);
  } catch(const spdlog::spdlog_ex& e) {
    g_sinks.error->error("Unable to open log file {}: {}", log_file.string(), e.what());
  }

  spdlog::set_default_logger(g_sinks.log);
  spdlog::set_level(level);
}

Logger::Logger() = default;
Logger::Logger(std::string name) : name_(std::move(name)) {}

void Logger::set_name(std::string name) {
  name_ = std::move(name);
}

LogListenerHandle Logger::add_listener(Listener listener, void* user_data) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(listener_mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, ListenerBinding{user_data, std::move(listener)});
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.erase(handle);
}

void Logger::clear_listeners() {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.clear();
}

void Logger::emit(LogChannel channel, const std::string& message) {
  const char* label = channel_label(channel);
  std::string channel_name = name_.empty() ? std::string(label) : name_ + ":" + label;
  if(dispatch(channel_name, channel_level(channel), message)) return;
  detail::emit_to_default(channel, channel_name, message);
}

bool Logger::dispatch(const std::string& channel,
                      spdlog::level::level_enum level,
                      const std::string& message) {
  std::vector<ListenerBinding> listeners_snapshot;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listeners_snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) {
      listeners_snapshot.push_back(entry.second);
    }
  }
  bool handled = false;
  for(auto& binding : listeners_snapshot) {
    try {
      if(binding.callback && binding.callback(binding.user_data, channel, level, message)) {
        handled = true;
      }
    } catch(const std::exception& e) {
      detail::emit_to_default(LogChannel::Error, "log", std::string("log listener threw: ") + e.what());
    }
  }
  return handled;
}

namespace detail {

void emit_to_default(LogChannel channel,
                     const std::string& channel_name,
                     const std::string& message) {
  if(!log_passthrough()) return;
  auto* sink = sink_for(channel);
  if(!sink) return;

  auto level = channel_level(channel);
  const bool plain = channel == LogChannel::Print || channel == LogChannel::PrintErr;
  if(!plain && channel_name != channel_label(channel)) {
    sink->log(level, fmt::format("[{}] {}", channel_name, message));
  } else {
    sink->log(level, message);
  }
}

} // namespace detail
