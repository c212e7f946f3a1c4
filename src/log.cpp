#include "log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <vector>

namespace {

constexpr const char* kStampedPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

struct DefaultSinks {
  std::shared_ptr<spdlog::logger> stamped_out;
  std::shared_ptr<spdlog::logger> stamped_err;
  std::shared_ptr<spdlog::logger> plain_out;
  std::shared_ptr<spdlog::logger> plain_err;
};

std::mutex g_sinks_mutex;
DefaultSinks g_sinks;
std::atomic<bool> g_log_passthrough{true};

std::shared_ptr<spdlog::logger> make_logger(const std::string& name,
                                            std::vector<spdlog::sink_ptr> sinks) {
  auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
  logger->set_level(spdlog::level::info);
  return logger;
}

// Caller holds g_sinks_mutex.
void build_sinks(const LogOptions& options) {
  auto out_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  out_sink->set_pattern(kStampedPattern);
  auto err_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  err_sink->set_pattern(kStampedPattern);
  auto plain_out_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  plain_out_sink->set_pattern("%v");
  auto plain_err_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  plain_err_sink->set_pattern("%v");

  std::vector<spdlog::sink_ptr> out_sinks{out_sink};
  std::vector<spdlog::sink_ptr> err_sinks{err_sink};
  if(!options.log_file.empty()) {
    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.log_file, false);
    file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    out_sinks.push_back(file_sink);
    err_sinks.push_back(file_sink);
  }

  g_sinks.stamped_out = make_logger("roomdrop.out", std::move(out_sinks));
  g_sinks.stamped_err = make_logger("roomdrop.err", std::move(err_sinks));
  g_sinks.plain_out = make_logger("roomdrop.print", {plain_out_sink});
  g_sinks.plain_err = make_logger("roomdrop.print_err", {plain_err_sink});

  g_sinks.stamped_out->flush_on(spdlog::level::warn);
  g_sinks.stamped_err->flush_on(spdlog::level::err);
  g_sinks.plain_out->flush_on(spdlog::level::info);
  g_sinks.plain_err->flush_on(spdlog::level::err);
}

DefaultSinks current_sinks() {
  std::lock_guard lock(g_sinks_mutex);
  if(!g_sinks.stamped_out) build_sinks(LogOptions{});
  return g_sinks;
}

spdlog::level::level_enum level_for(LogChannel channel) {
  switch(channel) {
    case LogChannel::Warn: return spdlog::level::warn;
    case LogChannel::Error:
    case LogChannel::PrintErr: return spdlog::level::err;
    case LogChannel::Debug: return spdlog::level::debug;
    case LogChannel::Info:
    case LogChannel::Print: break;
  }
  return spdlog::level::info;
}

} // namespace

const char* channel_name(LogChannel channel) {
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

void init(const LogOptions& options) {
  std::lock_guard lock(g_sinks_mutex);
  try {
    build_sinks(options);
  } catch(const spdlog::spdlog_ex& e) {
    // unusable log file: keep console output
    build_sinks(LogOptions{options.verbose, {}});
    g_sinks.stamped_err->error("Cannot open log file {}: {}", options.log_file, e.what());
  }
  g_sinks.stamped_out->set_level(options.verbose ? spdlog::level::debug : spdlog::level::info);
  spdlog::set_default_logger(g_sinks.stamped_out);
}

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

Logger::Logger() = default;
Logger::Logger(std::string name) : name_(std::move(name)) {}

void Logger::set_name(std::string name) {
  name_ = std::move(name);
}

LogListenerHandle Logger::add_listener(Listener listener) {
  if(!listener) return 0;
  std::lock_guard lock(listener_mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, std::move(listener));
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard lock(listener_mutex_);
  listeners_.erase(handle);
}

void Logger::clear_listeners() {
  std::lock_guard lock(listener_mutex_);
  listeners_.clear();
}

void Logger::write(LogChannel channel, std::string message) {
  LogRecord record;
  record.source = name_;
  record.channel = channel;
  record.level = level_for(channel);
  record.message = std::move(message);
  if(dispatch(record)) return;
  detail::emit_to_default(record);
}

bool Logger::dispatch(const LogRecord& record) {
  std::vector<Listener> snapshot;
  {
    std::lock_guard lock(listener_mutex_);
    snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) {
      snapshot.push_back(entry.second);
    }
  }
  bool handled = false;
  for(auto& listener : snapshot) {
    try {
      if(listener(record)) handled = true;
    } catch(const std::exception& e) {
      LogRecord failure;
      failure.channel = LogChannel::Error;
      failure.level = spdlog::level::err;
      failure.message = fmt::format("log listener threw: {}", e.what());
      detail::emit_to_default(failure);
    }
  }
  return handled;
}

namespace detail {

void emit_to_default(const LogRecord& record) {
  if(!log_passthrough()) return;
  auto sinks = current_sinks();

  spdlog::logger* sink = nullptr;
  switch(record.channel) {
    case LogChannel::Print: sink = sinks.plain_out.get(); break;
    case LogChannel::PrintErr: sink = sinks.plain_err.get(); break;
    case LogChannel::Error: sink = sinks.stamped_err.get(); break;
    case LogChannel::Info:
    case LogChannel::Warn:
    case LogChannel::Debug: sink = sinks.stamped_out.get(); break;
  }
  if(!sink) return;

  const auto level = level_for(record.channel);
  const bool plain = record.channel == LogChannel::Print || record.channel == LogChannel::PrintErr;
  if(!record.source.empty() && !plain) {
    sink->log(level, "[{}] {}", record.source, record.message);
  } else {
    sink->log(level, "{}", record.message);
  }
}

} // namespace detail
