#pragma once
#include <atomic>
#include <cstdio>
#include <cstring>
#include <memory>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "backend.hpp"
#include "formatters/formatter_interface.hpp"
#include "log_level.hpp"
#include "log_record.hpp"
#include "rotation_config.hpp"
#include "rotation_observer.hpp"
#include "timestamp.hpp"

namespace rotalog
{

// A logger bound to one target file. Log/Logf may be called from any thread;
// they copy the line into the instance's queue and return. Appending,
// flushing and rotation happen in order on the instance's serial context.
class FileRotationLogger
{
 public:
  // Throws std::invalid_argument / std::system_error when the path or the
  // permission string is invalid or the target cannot be opened.
  explicit FileRotationLogger(const std::string& file_path,
                              const RotationConfig& config = RotationConfig{},
                              std::unique_ptr<IRotationObserver> observer = nullptr,
                              std::string_view file_permission = "640",
                              const RotationTuning& tuning = RotationTuning{});
  ~FileRotationLogger();

  FileRotationLogger(const FileRotationLogger&) = delete;
  FileRotationLogger& operator=(const FileRotationLogger&) = delete;

  void Log(LogLevel level, std::string_view message);

  template <typename... Args>
  void Logf(LogLevel level, const char* format_str, Args&&... args);

  void SetLevel(LogLevel level);
  LogLevel Level() const;

  // Only before Start(), or while no Drain() is in progress.
  void SetFormatter(std::unique_ptr<IFormatter> formatter);

  void Start();
  void Stop();
  size_t Drain(size_t max_records = 64);

  // Syncs pending lines ahead of the queued records.
  void RequestFlush();

  void SetRotationPaused(bool paused);
  bool RotationPaused() const;

  // Host lifecycle: going to background pauses rotation and forces a flush.
  void OnEnterBackground();
  void OnEnterForeground();

  const std::string& FilePath() const;
  const RotationConfig& Config() const;

  uint64_t DropCount() const { return drop_count_.load(std::memory_order_relaxed); }
  void ResetDropCount() { drop_count_.store(0, std::memory_order_relaxed); }
  uint64_t RotationCount() const;
  uint64_t WriteFailures() const;

 private:
  std::unique_ptr<LoggerBackend> backend_;
  std::atomic<LogLevel> level_{LogLevel::Trace};
  std::atomic<uint64_t> sequence_{0};
  std::atomic<uint64_t> drop_count_{0};
  bool started_ = false;

  void Enqueue(LogRecord& record);
};

// ===== Logf template implementation =====

template <typename... Args>
void FileRotationLogger::Logf(LogLevel level, const char* format_str, Args&&... args)
{
  if (level < Level() || level == LogLevel::Off)
  {
    return;
  }

  LogRecord record{};
  record.level = level;
  try
  {
    auto result = fmt::format_to_n(record.msg, ROTALOG_MAX_MSG_LEN - 1, fmt::runtime(format_str),
                                   std::forward<Args>(args)...);
    size_t len = result.size < ROTALOG_MAX_MSG_LEN - 1 ? result.size : ROTALOG_MAX_MSG_LEN - 1;
    record.msg_len = static_cast<uint16_t>(len);
  }
  catch (const fmt::format_error& e)
  {
    int n = std::snprintf(record.msg, ROTALOG_MAX_MSG_LEN, "<format error: %s> %s", e.what(),
                          format_str);
    record.msg_len = static_cast<uint16_t>(
        n < 0 ? 0 : (n < ROTALOG_MAX_MSG_LEN ? n : ROTALOG_MAX_MSG_LEN - 1));
  }
  record.msg[record.msg_len] = '\0';
  Enqueue(record);
}

}  // namespace rotalog

// ===== Logging macros =====

// Compile-time minimum active level (-DROTALOG_ACTIVE_LEVEL=2)
#ifndef ROTALOG_ACTIVE_LEVEL
    #ifdef NDEBUG
        #define ROTALOG_ACTIVE_LEVEL 2  // Info
    #else
        #define ROTALOG_ACTIVE_LEVEL 0  // Trace
    #endif
#endif

#define ROTALOG_CALL(logger, lvl, fmt_str, ...) \
    do { \
        constexpr auto _rl_lvl = ::rotalog::LogLevel::lvl; \
        if (static_cast<int>(_rl_lvl) >= ROTALOG_ACTIVE_LEVEL) { \
            (logger).Logf(_rl_lvl, fmt_str, ##__VA_ARGS__); \
        } \
    } while (0)

#define ROTALOG_TRACE(logger, fmt, ...) ROTALOG_CALL(logger, Trace, fmt, ##__VA_ARGS__)
#define ROTALOG_DEBUG(logger, fmt, ...) ROTALOG_CALL(logger, Debug, fmt, ##__VA_ARGS__)
#define ROTALOG_INFO(logger, fmt, ...)  ROTALOG_CALL(logger, Info,  fmt, ##__VA_ARGS__)
#define ROTALOG_WARN(logger, fmt, ...)  ROTALOG_CALL(logger, Warn,  fmt, ##__VA_ARGS__)
#define ROTALOG_ERROR(logger, fmt, ...) ROTALOG_CALL(logger, Error, fmt, ##__VA_ARGS__)
#define ROTALOG_FATAL(logger, fmt, ...) ROTALOG_CALL(logger, Fatal, fmt, ##__VA_ARGS__)
