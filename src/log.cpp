#include "log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <atomic>
#include <cstring>
#include <vector>

namespace {
std::shared_ptr<spdlog::logger> g_info_logger;
std::shared_ptr<spdlog::logger> g_error_logger;
std::shared_ptr<spdlog::logger> g_print_logger;
std::shared_ptr<spdlog::logger> g_print_err_logger;
std::shared_ptr<spdlog::sinks::basic_file_sink_mt> g_file_sink;
std::mutex g_setup_mutex;
std::atomic<bool> g_log_passthrough{true};

constexpr const char* kRecordPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";

void create_loggers_locked() {
  if(g_info_logger) return;

  auto info_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  info_sink->set_pattern(kRecordPattern);

  auto error_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  error_sink->set_pattern(kRecordPattern);

  auto plain_out_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  plain_out_sink->set_pattern("%v");

  auto plain_err_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  plain_err_sink->set_pattern("%v");

  g_info_logger = std::make_shared<spdlog::logger>("chunkmesh.info", std::move(info_sink));
  g_error_logger = std::make_shared<spdlog::logger>("chunkmesh.error", std::move(error_sink));
  g_print_logger = std::make_shared<spdlog::logger>("chunkmesh.print", std::move(plain_out_sink));
  g_print_err_logger = std::make_shared<spdlog::logger>("chunkmesh.print_err", std::move(plain_err_sink));

  g_info_logger->flush_on(spdlog::level::warn);
  g_error_logger->flush_on(spdlog::level::err);
  g_print_logger->flush_on(spdlog::level::info);
  g_print_err_logger->flush_on(spdlog::level::err);
}

void ensure_loggers() {
  std::lock_guard<std::mutex> lock(g_setup_mutex);
  create_loggers_locked();
}

spdlog::logger* sink_for_channel(const char* base_channel) {
  if(std::strcmp(base_channel, "print") == 0) return g_print_logger.get();
  if(std::strcmp(base_channel, "print_err") == 0) return g_print_err_logger.get();
  if(std::strcmp(base_channel, "error") == 0) return g_error_logger.get();
  return g_info_logger.get();
}

} // namespace

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

void init_logging(bool verbose, const std::string& log_file) {
  std::lock_guard<std::mutex> lock(g_setup_mutex);
  create_loggers_locked();

  if(!log_file.empty() && !g_file_sink) {
    // Opening the file can throw spdlog::spdlog_ex; callers treat that as a
    // configuration error.
    g_file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
    g_file_sink->set_pattern(kRecordPattern);
    g_info_logger->sinks().push_back(g_file_sink);
    g_error_logger->sinks().push_back(g_file_sink);
  }

  auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  g_info_logger->set_level(level);
  g_error_logger->set_level(spdlog::level::info);
  g_print_logger->set_level(spdlog::level::info);
  g_print_err_logger->set_level(spdlog::level::info);
}

Logger::Logger()
  : registry_(std::make_shared<ListenerRegistry>()) {}

Logger::Logger(std::string name)
  : name_(std::move(name)),
    registry_(std::make_shared<ListenerRegistry>()) {}

Logger::Logger(std::string name, std::shared_ptr<ListenerRegistry> registry)
  : name_(std::move(name)),
    registry_(std::move(registry)) {}

void Logger::set_name(std::string name) {
  name_ = std::move(name);
}

std::shared_ptr<Logger> Logger::child(const std::string& suffix) const {
  std::string name = name_.empty() ? suffix : name_ + ":" + suffix;
  return std::shared_ptr<Logger>(new Logger(std::move(name), registry_));
}

LogListenerHandle Logger::add_listener(Listener listener, void* user_data) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(registry_->mutex);
  const auto id = registry_->next_id++;
  registry_->listeners.emplace(id, ListenerBinding{user_data, std::move(listener)});
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(registry_->mutex);
  registry_->listeners.erase(handle);
}

void Logger::clear_listeners() {
  std::lock_guard<std::mutex> lock(registry_->mutex);
  registry_->listeners.clear();
}

bool Logger::dispatch(const std::string& channel,
                      spdlog::level::level_enum level,
                      const std::string& message) {
  std::vector<ListenerBinding> listeners_snapshot;
  {
    std::lock_guard<std::mutex> lock(registry_->mutex);
    listeners_snapshot.reserve(registry_->listeners.size());
    for(const auto& entry : registry_->listeners) {
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
      detail::emit_to_default("error", name_, spdlog::level::err,
                              fmt::format("log listener threw: {}", e.what()));
    }
  }
  return handled;
}

void Logger::emit(const char* base_channel,
                  spdlog::level::level_enum level,
                  const std::string& message) const {
  detail::emit_to_default(base_channel, name_, level, message);
}

namespace detail {

void emit_to_default(const char* base_channel,
                     const std::string& source,
                     spdlog::level::level_enum level,
                     const std::string& message) {
  ensure_loggers();
  if(!log_passthrough()) return;

  spdlog::logger* sink = sink_for_channel(base_channel);
  if(!sink) return;
  const bool plain = sink == g_print_logger.get() || sink == g_print_err_logger.get();
  if(!source.empty() && !plain) {
    sink->log(level, "[{}] {}", source, message);
  } else {
    sink->log(level, "{}", message);
  }
}

} // namespace detail
