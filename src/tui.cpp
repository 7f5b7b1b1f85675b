#include "tui.h"

#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>

namespace {

using packup::tui::level;

// Logging is synchronous: each message reaches the handler before the call
// returns, serialized by one mutex so lines from worker threads never mix.
struct logger_state {
  std::mutex mutex;
  std::function<void(std::string_view)> handler;  // empty writes to stderr
  std::optional<level> threshold;
  bool decorated{ false };
  bool initialized{ false };
  bool running{ false };  // messages logged while idle are dropped
} s_log{};

char const *level_label(level value) {
  switch (value) {
    case level::TUI_DEBUG: return "DBG";
    case level::TUI_INFO: return "INF";
    case level::TUI_WARN: return "WRN";
    case level::TUI_ERROR: return "ERR";
  }
  return "???";
}

// "[2024-01-31 12:00:00.123] [INF] "
std::string decoration(level severity) {
  auto const now{ std::chrono::system_clock::now() };
  auto const millis{
    std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000
  };
  std::time_t const t{ std::chrono::system_clock::to_time_t(now) };
  std::tm tm{};
  localtime_r(&t, &tm);

  char stamp[32]{};
  std::strftime(stamp, sizeof stamp, "%Y-%m-%d %H:%M:%S", &tm);

  char buf[64]{};
  std::snprintf(buf,
                sizeof buf,
                "[%s.%03d] [%s] ",
                stamp,
                static_cast<int>(millis),
                level_label(severity));
  return buf;
}

std::string vformat(char const *fmt, va_list args) {
  va_list measure;
  va_copy(measure, args);
  int const n{ std::vsnprintf(nullptr, 0, fmt, measure) };
  va_end(measure);
  if (n <= 0) { return {}; }

  std::string out(static_cast<std::size_t>(n) + 1, '\0');
  std::vsnprintf(out.data(), out.size(), fmt, args);
  out.resize(static_cast<std::size_t>(n));
  return out;
}

void emit(level severity, char const *fmt, va_list args) {
  if (fmt == nullptr) { return; }

  std::lock_guard<std::mutex> lock{ s_log.mutex };
  if (!s_log.running) { return; }
  if (s_log.threshold && severity < *s_log.threshold) { return; }

  std::string line{ s_log.decorated ? decoration(severity) : std::string{} };
  line += vformat(fmt, args);
  line += '\n';

  if (s_log.handler) {
    s_log.handler(line);
  } else {
    std::fwrite(line.data(), 1, line.size(), stderr);
    std::fflush(stderr);
  }
}

}  // namespace

namespace packup::tui {

void init() {
  std::lock_guard<std::mutex> lock{ s_log.mutex };
  if (s_log.initialized) { throw std::logic_error{ "tui::init called more than once" }; }
  s_log.initialized = true;
}

void set_output_handler(std::function<void(std::string_view)> handler) {
  std::lock_guard<std::mutex> lock{ s_log.mutex };
  if (!s_log.initialized) {
    throw std::logic_error{ "tui::set_output_handler called before init" };
  }
  if (s_log.running) {
    throw std::logic_error{ "tui::set_output_handler called while running" };
  }
  s_log.handler = std::move(handler);
}

void run(std::optional<level> threshold, bool decorated_logging) {
  std::lock_guard<std::mutex> lock{ s_log.mutex };
  if (!s_log.initialized) { throw std::logic_error{ "tui::run called before init" }; }
  if (s_log.running) { throw std::logic_error{ "tui::run called while running" }; }
  s_log.threshold = threshold;
  s_log.decorated = decorated_logging;
  s_log.running = true;
}

void shutdown() {
  std::lock_guard<std::mutex> lock{ s_log.mutex };
  if (!s_log.running) { throw std::logic_error{ "tui::shutdown called while not running" }; }
  s_log.running = false;
}

#define PACKUP_TUI_LOG(name, severity) \
  void name(char const *fmt, ...) {    \
    va_list args;                      \
    va_start(args, fmt);               \
    emit(severity, fmt, args);         \
    va_end(args);                      \
  }

PACKUP_TUI_LOG(debug, level::TUI_DEBUG)
PACKUP_TUI_LOG(info, level::TUI_INFO)
PACKUP_TUI_LOG(warn, level::TUI_WARN)
PACKUP_TUI_LOG(error, level::TUI_ERROR)

#undef PACKUP_TUI_LOG

void print_stdout(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  auto const text{ vformat(fmt, args) };
  va_end(args);

  std::lock_guard<std::mutex> lock{ s_log.mutex };
  std::fwrite(text.data(), 1, text.size(), stdout);
  std::fflush(stdout);
}

scope::scope(std::optional<level> threshold, bool decorated_logging) {
  run(threshold, decorated_logging);
  active = true;
}

scope::~scope() {
  if (!active) { return; }
  try {
    shutdown();
  } catch (std::logic_error const &e) {
    std::fprintf(stderr, "tui::scope: %s\n", e.what());
  }
}

}  // namespace packup::tui
