/**
 * @file log.hpp
 * @brief printf-style logging with runtime level gate and pluggable sink.
 *
 * Every log call is formatted into a fixed-size LogEntry (POD) and handed
 * to the installed sink (stderr by default). Workers use the same LogEntry
 * record for their deferred trace queues, so a trace line produced on a
 * worker thread and flushed during Drain() reaches the same sink as a
 * direct call.
 *
 * Compile-time configuration:
 *   OFFLOAD_LOG_MIN_LEVEL -- 0=DEBUG .. 4=FATAL, 5=OFF (default 0)
 *
 * Usage:
 * @code
 *   offload::log::Init();
 *   OFFLOAD_LOG_INFO("WorkerPool", "started %u workers", n);
 * @endcode
 */

#ifndef OFFLOAD_LOG_HPP_
#define OFFLOAD_LOG_HPP_

#include "offload/platform.hpp"

#include <atomic>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <functional>
#include <thread>
#include <type_traits>

#if defined(OFFLOAD_PLATFORM_LINUX) || defined(OFFLOAD_PLATFORM_MACOS)
#include <sys/syscall.h>
#include <time.h>
#include <unistd.h>
#endif

#ifndef OFFLOAD_LOG_MIN_LEVEL
#define OFFLOAD_LOG_MIN_LEVEL 0
#endif

namespace offload {
namespace log {

// ============================================================================
// Level
// ============================================================================

enum class Level : uint8_t {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
  kFatal = 4,
  kOff = 5,
};

// ============================================================================
// LogEntry -- Pre-formatted log record
// ============================================================================

/**
 * @brief Fixed-size log record. Trivially copyable so it can live in a
 *        lock-free ring buffer. Size: 320 bytes = 5 cache lines.
 */
struct LogEntry {
  uint64_t timestamp_ns;   ///<  8B  Monotonic timestamp.
  uint32_t wallclock_sec;  ///<  4B  Wall-clock seconds since epoch.
  uint16_t wallclock_ms;   ///<  2B  Wall-clock milliseconds.
  Level level;             ///<  1B  Severity level.
  uint8_t padding0;        ///<  1B  Alignment padding.
  char category[16];       ///< 16B  Null-terminated category string.
  char message[256];       ///<256B  Pre-formatted message.
  char file[24];           ///< 24B  Source file basename (truncated).
  uint32_t line;           ///<  4B  Source line number.
  uint32_t thread_id;      ///<  4B  Producing thread.
};

static_assert(sizeof(LogEntry) == 320, "LogEntry size must be 320 bytes");
static_assert(std::is_trivially_copyable<LogEntry>::value,
              "LogEntry must be trivially copyable");

/// @brief Sink receiving one formatted entry.
using LogSinkFn = void (*)(const LogEntry& entry, void* context);

// ============================================================================
// Internal Detail
// ============================================================================

namespace detail {

inline std::atomic<Level>& LogLevelRef() noexcept {
#ifdef NDEBUG
  static std::atomic<Level> level{Level::kInfo};
#else
  static std::atomic<Level> level{Level::kDebug};
#endif
  return level;
}

inline std::atomic<bool>& InitializedRef() noexcept {
  static std::atomic<bool> flag{false};
  return flag;
}

struct SinkSlot {
  std::atomic<LogSinkFn> fn{nullptr};
  std::atomic<void*> context{nullptr};
};

inline SinkSlot& Sink() noexcept {
  static SinkSlot slot;
  return slot;
}

inline const char* LevelTag(Level level) noexcept {
  switch (level) {
    case Level::kDebug:
      return "DEBUG";
    case Level::kInfo:
      return "INFO";
    case Level::kWarn:
      return "WARN";
    case Level::kError:
      return "ERROR";
    case Level::kFatal:
      return "FATAL";
    case Level::kOff:
      return "OFF";
  }
  return "?";
}

inline uint32_t GetCachedThreadId() noexcept {
  static thread_local uint32_t tl_tid = 0;
  if (tl_tid == 0) {
#if defined(OFFLOAD_PLATFORM_LINUX)
    tl_tid = static_cast<uint32_t>(::syscall(SYS_gettid));
#else
    tl_tid = static_cast<uint32_t>(
        std::hash<std::thread::id>{}(std::this_thread::get_id()));
#endif
  }
  return tl_tid;
}

/// @brief Copy src to dst with truncation. Always null-terminates.
inline void SafeStrCopy(char* dst, size_t dst_size, const char* src) noexcept {
  if (src == nullptr || dst_size == 0) {
    if (dst_size > 0) dst[0] = '\0';
    return;
  }
  size_t len = std::strlen(src);
  if (len >= dst_size) {
    len = dst_size - 1;
  }
  std::memcpy(dst, src, len);
  dst[len] = '\0';
}

inline const char* Basename(const char* path) noexcept {
  if (path == nullptr) return "?";
  const char* slash = std::strrchr(path, '/');
  return (slash != nullptr) ? slash + 1 : path;
}

inline void CaptureWallclock(uint32_t& sec, uint16_t& ms) noexcept {
#if defined(OFFLOAD_PLATFORM_LINUX) || defined(OFFLOAD_PLATFORM_MACOS)
  struct timespec ts;
  clock_gettime(CLOCK_REALTIME, &ts);
  sec = static_cast<uint32_t>(ts.tv_sec);
  ms = static_cast<uint16_t>(ts.tv_nsec / 1000000L);
#else
  sec = static_cast<uint32_t>(std::time(nullptr));
  ms = 0;
#endif
}

/// @brief Default sink: one line per entry on stderr.
inline void StderrSink(const LogEntry& e, void* /*ctx*/) noexcept {
  char ts_buf[32];
  time_t t = static_cast<time_t>(e.wallclock_sec);
  struct tm tm_local;
#if defined(OFFLOAD_PLATFORM_LINUX) || defined(OFFLOAD_PLATFORM_MACOS)
  localtime_r(&t, &tm_local);
#else
  tm_local = *std::localtime(&t);
#endif
  (void)std::snprintf(ts_buf, sizeof(ts_buf), "%04d-%02d-%02d %02d:%02d:%02d.%03u",
                      tm_local.tm_year + 1900, tm_local.tm_mon + 1,
                      tm_local.tm_mday, tm_local.tm_hour, tm_local.tm_min,
                      tm_local.tm_sec, static_cast<unsigned>(e.wallclock_ms));
#ifdef NDEBUG
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s\n", ts_buf, LevelTag(e.level),
                     e.category, e.message);
#else
  (void)std::fprintf(stderr, "[%s] [%s] [%s] %s (%s:%u)\n", ts_buf,
                     LevelTag(e.level), e.category, e.message, e.file, e.line);
#endif
  if (static_cast<uint8_t>(e.level) >= static_cast<uint8_t>(Level::kError)) {
    (void)std::fflush(stderr);
  }
}

}  // namespace detail

// ============================================================================
// Public API
// ============================================================================

inline void SetLevel(Level level) noexcept {
  detail::LogLevelRef().store(level, std::memory_order_relaxed);
}

inline Level GetLevel() noexcept {
  return detail::LogLevelRef().load(std::memory_order_relaxed);
}

/// @brief Parse "debug" / "info" / "warn" / "error" / "fatal" / "off".
/// @return kInfo for unrecognised input.
inline Level ParseLevel(const char* name) noexcept {
  if (name == nullptr) return Level::kInfo;
  static constexpr const char* kNames[] = {"debug", "info", "warn",
                                           "error", "fatal", "off"};
  for (uint8_t i = 0; i < 6U; ++i) {
    const char* a = name;
    const char* b = kNames[i];
    while (*a != '\0' && *b != '\0' &&
           ((*a >= 'A' && *a <= 'Z') ? static_cast<char>(*a + 32) : *a) == *b) {
      ++a;
      ++b;
    }
    if (*a == '\0' && *b == '\0') return static_cast<Level>(i);
  }
  return Level::kInfo;
}

/**
 * @brief Install the output sink. nullptr restores the stderr sink.
 *
 * Must not race with concurrent log calls that capture the old context.
 */
inline void SetSink(LogSinkFn fn, void* context = nullptr) noexcept {
  detail::Sink().context.store(context, std::memory_order_release);
  detail::Sink().fn.store(fn, std::memory_order_release);
}

/**
 * @brief Initialise logging. Applies OFFLOAD_LOG_LEVEL from the environment
 *        when present. Idempotent.
 */
inline void Init() noexcept {
  const char* env = std::getenv("OFFLOAD_LOG_LEVEL");
  if (env != nullptr) {
    SetLevel(ParseLevel(env));
  }
  detail::InitializedRef().store(true, std::memory_order_release);
}

inline void Shutdown() noexcept {
  (void)std::fflush(stderr);
  detail::InitializedRef().store(false, std::memory_order_release);
}

inline bool IsInitialized() noexcept {
  return detail::InitializedRef().load(std::memory_order_acquire);
}

/// @brief Hand an already formatted entry to the sink (runtime level gated).
inline void WriteEntry(const LogEntry& entry) noexcept {
  if (static_cast<uint8_t>(entry.level) < static_cast<uint8_t>(GetLevel())) {
    return;
  }
  LogSinkFn fn = detail::Sink().fn.load(std::memory_order_acquire);
  void* ctx = detail::Sink().context.load(std::memory_order_acquire);
  if (fn == nullptr) {
    detail::StderrSink(entry, nullptr);
  } else {
    fn(entry, ctx);
  }
}

/// @brief Fill a LogEntry without emitting it.
inline void FormatEntryVa(LogEntry& entry, Level level, const char* category,
                          const char* file, int line, const char* fmt,
                          va_list args) noexcept {
  entry.timestamp_ns = SteadyNowNs();
  detail::CaptureWallclock(entry.wallclock_sec, entry.wallclock_ms);
  entry.level = level;
  entry.padding0 = 0;
  entry.thread_id = detail::GetCachedThreadId();
  entry.line = static_cast<uint32_t>(line);
  detail::SafeStrCopy(entry.category, sizeof(entry.category), category);
  detail::SafeStrCopy(entry.file, sizeof(entry.file), detail::Basename(file));
  (void)std::vsnprintf(entry.message, sizeof(entry.message), fmt, args);
}

inline void FormatEntry(LogEntry& entry, Level level, const char* category,
                        const char* file, int line, const char* fmt, ...) noexcept {
  va_list args;
  va_start(args, fmt);
  FormatEntryVa(entry, level, category, file, line, fmt, args);
  va_end(args);
}

inline void LogWriteVa(Level level, const char* category, const char* file,
                       int line, const char* fmt, va_list args) noexcept {
  if (static_cast<uint8_t>(level) < static_cast<uint8_t>(GetLevel())) {
    return;
  }
  LogEntry entry;
  FormatEntryVa(entry, level, category, file, line, fmt, args);
  WriteEntry(entry);
}

inline void LogWrite(Level level, const char* category, const char* file,
                     int line, const char* fmt, ...) noexcept {
  va_list args;
  va_start(args, fmt);
  LogWriteVa(level, category, file, line, fmt, args);
  va_end(args);
}

}  // namespace log
}  // namespace offload

// ============================================================================
// Macros
// ============================================================================

#define OFFLOAD_LOG_DEBUG(cat, fmt, ...)                                   \
  do {                                                                     \
    if (OFFLOAD_LOG_MIN_LEVEL <= 0) {                                      \
      ::offload::log::LogWrite(::offload::log::Level::kDebug, cat,        \
                               __FILE__, __LINE__, fmt, ##__VA_ARGS__);   \
    }                                                                      \
  } while (0)

#define OFFLOAD_LOG_INFO(cat, fmt, ...)                                    \
  do {                                                                     \
    if (OFFLOAD_LOG_MIN_LEVEL <= 1) {                                      \
      ::offload::log::LogWrite(::offload::log::Level::kInfo, cat,         \
                               __FILE__, __LINE__, fmt, ##__VA_ARGS__);   \
    }                                                                      \
  } while (0)

#define OFFLOAD_LOG_WARN(cat, fmt, ...)                                    \
  do {                                                                     \
    if (OFFLOAD_LOG_MIN_LEVEL <= 2) {                                      \
      ::offload::log::LogWrite(::offload::log::Level::kWarn, cat,         \
                               __FILE__, __LINE__, fmt, ##__VA_ARGS__);   \
    }                                                                      \
  } while (0)

#define OFFLOAD_LOG_ERROR(cat, fmt, ...)                                   \
  do {                                                                     \
    if (OFFLOAD_LOG_MIN_LEVEL <= 3) {                                      \
      ::offload::log::LogWrite(::offload::log::Level::kError, cat,        \
                               __FILE__, __LINE__, fmt, ##__VA_ARGS__);   \
    }                                                                      \
  } while (0)

#define OFFLOAD_LOG_FATAL(cat, fmt, ...)                                   \
  do {                                                                     \
    ::offload::log::LogWrite(::offload::log::Level::kFatal, cat, __FILE__, \
                             __LINE__, fmt, ##__VA_ARGS__);                \
    std::abort();                                                          \
  } while (0)

#endif  // OFFLOAD_LOG_HPP_
