#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

// Sets up the console sinks, plus a file sink when log_file is non-empty.
// Later calls only adjust the level and (re)attach the file sink.
void init(bool verbose = false, const std::filesystem::path& log_file = {});
void set_log_passthrough(bool enabled);
bool log_passthrough();

enum class LogChannel {
  Info,
  Warn,
  Error,
  Debug,
  Print,    // plain user-facing stdout
  PrintErr  // plain user-facing stderr
};

const char* channel_label(LogChannel channel);
spdlog::level::level_enum channel_level(LogChannel channel);

using LogListenerHandle = std::size_t;

class Logger {
public:
  // Return true from a listener to suppress the default sinks for that line.
  using Listener = std::function<bool(void* user_data,
                                      const std::string& channel,
                                      spdlog::level::level_enum level,
                                      const std::string& message)>;

  Logger();
  explicit Logger(std::string name);

  void set_name(std::string name);
  const std::string& name() const { return name_; }

  LogListenerHandle add_listener(Listener listener, void* user_data = nullptr);
  void remove_listener(LogListenerHandle handle);
  void clear_listeners();

  template<typename... Args>
  void write(LogChannel channel, spdlog::format_string_t<Args...> fmt, Args&&... args) {
    emit(channel, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Info, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Warn, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Error, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Debug, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void print(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Print, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void print_err(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::PrintErr, fmt, std::forward<Args>(args)...);
  }

  void emit(LogChannel channel, const std::string& message);

private:
  bool dispatch(const std::string& channel,
                spdlog::level::level_enum level,
                const std::string& message);

  struct ListenerBinding {
    void* user_data = nullptr;
    Listener callback;
  };

  std::string name_;
  std::mutex listener_mutex_;
  std::unordered_map<LogListenerHandle, ListenerBinding> listeners_;
  std::atomic<LogListenerHandle> next_listener_id_{1};
};

namespace detail {
void emit_to_default(LogChannel channel,
                     const std::string& channel_name,
                     const std::string& message);

template<typename... Args>
void log_to(Logger* logger,
            LogChannel channel,
            spdlog::format_string_t<Args...> fmt,
            Args&&... args) {
  auto formatted = fmt::format(fmt, std::forward<Args>(args)...);
  if(logger) {
    logger->emit(channel, formatted);
  } else {
    emit_to_default(channel, channel_label(channel), formatted);
  }
}
} // namespace detail

template<typename... Args>
inline void log_info(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::log_to(logger, LogChannel::Info, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_warn(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::log_to(logger, LogChannel::Warn, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_error(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::log_to(logger, LogChannel::Error, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_debug(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::log_to(logger, LogChannel::Debug, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void print_out(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::log_to(logger, LogChannel::Print, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void print_err(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::log_to(logger, LogChannel::PrintErr, fmt, std::forward<Args>(args)...);
}
