#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <atomic>
#include <cstring>
#include <mutex>
#include <vector>

namespace {

constexpr const char* kPlainPattern = "%v";
constexpr const char* kStampedPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
constexpr const char* kDebugPattern = "[%H:%M:%S] [%^%l%$] %v";

std::shared_ptr<spdlog::logger> g_diag_logger;
std::shared_ptr<spdlog::logger> g_error_logger;
std::shared_ptr<spdlog::logger> g_print_logger;
std::shared_ptr<spdlog::logger> g_print_err_logger;
std::mutex g_create_mutex;
std::atomic<bool> g_log_passthrough{true};

std::shared_ptr<spdlog::logger> make_logger(const char* name,
                                            spdlog::sink_ptr sink,
                                            const char* pattern) {
  sink->set_pattern(pattern);
  auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
  spdlog::register_logger(logger);
  return logger;
}

void ensure_loggers() {
  std::lock_guard<std::mutex> lock(g_create_mutex);
  if(g_diag_logger) return;

  g_diag_logger = make_logger("invmesh.diag",
                              std::make_shared<spdlog::sinks::stderr_color_sink_mt>(),
                              kStampedPattern);
  g_error_logger = make_logger("invmesh.error",
                               std::make_shared<spdlog::sinks::stderr_color_sink_mt>(),
                               kStampedPattern);
  g_print_logger = make_logger("invmesh.print",
                               std::make_shared<spdlog::sinks::stdout_color_sink_mt>(),
                               kPlainPattern);
  g_print_err_logger = make_logger("invmesh.print_err",
                                   std::make_shared<spdlog::sinks::stderr_color_sink_mt>(),
                                   kPlainPattern);

  // Diagnostics stay quiet unless init() asks for more.
  g_diag_logger->set_level(spdlog::level::warn);
  g_diag_logger->flush_on(spdlog::level::warn);
  g_error_logger->flush_on(spdlog::level::err);
  g_print_logger->flush_on(spdlog::level::info);
  g_print_err_logger->flush_on(spdlog::level::err);
}

} // namespace

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

Logger::Logger() = default;
Logger::Logger(std::string name) : name_(std::move(name)) {}

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
      detail::emit_to_default("error", "log-listener", spdlog::level::err,
                              fmt::format("listener threw: {}", e.what()));
    }
  }
  return handled;
}

void Logger::detail_emit(const char* base_channel,
                         const std::string& channel_name,
                         spdlog::level::level_enum level,
                         const std::string& message) {
  detail::emit_to_default(base_channel, channel_name, level, message);
}

void init(bool verbose, bool debug) {
  ensure_loggers();
  auto level = (verbose || debug) ? spdlog::level::debug : spdlog::level::warn;
  g_diag_logger->set_level(level);
  g_diag_logger->set_pattern(debug ? kDebugPattern : kStampedPattern);
  g_error_logger->set_level(spdlog::level::info);
  g_print_logger->set_level(spdlog::level::info);
  g_print_err_logger->set_level(spdlog::level::info);

  spdlog::set_default_logger(g_diag_logger);
  spdlog::set_level(level);
}

namespace detail {

void emit_to_default(const char* base_channel,
                     const std::string& channel_name,
                     spdlog::level::level_enum level,
                     const std::string& message) {
  ensure_loggers();
  if(!log_passthrough()) return;

  spdlog::logger* sink = nullptr;
  bool plain = false;
  if(std::strcmp(base_channel, "print") == 0) {
    sink = g_print_logger.get();
    plain = true;
  } else if(std::strcmp(base_channel, "print_err") == 0) {
    sink = g_print_err_logger.get();
    plain = true;
  } else if(std::strcmp(base_channel, "error") == 0) {
    sink = g_error_logger.get();
  } else {
    sink = g_diag_logger.get();
  }

  if(!sink) return;
  if(!plain && !channel_name.empty() && channel_name != base_channel) {
    sink->log(level, fmt::format("[{}] {}", channel_name, message));
  } else {
    sink->log(level, message);
  }
}

} // namespace detail
