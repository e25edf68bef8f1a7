#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "formatters/formatter_interface.hpp"
#include "log_record.hpp"
#include "rotation_config.hpp"
#include "rotation_executor.hpp"
#include "rotation_observer.hpp"
#include "rotation_throttle.hpp"
#include "target_file.hpp"
#include "write_buffer.hpp"

namespace rotalog
{

// Write path of one target file: append a line, count it in the write
// buffer, flush when due, then let the throttle decide whether to stat the
// file and rotate it. Everything except the constructor must run on a single
// serial context; nothing after construction throws.
class RotatingFileWriter
{
 public:
  // Throws std::invalid_argument for an empty path, a path naming a
  // directory or an invalid permission string, and std::system_error when
  // the parent directory cannot be created or the target cannot be opened.
  RotatingFileWriter(const std::string& file_path, std::string_view file_permission,
                     const RotationConfig& config, const RotationTuning& tuning,
                     std::unique_ptr<IRotationObserver> observer = nullptr);
  ~RotatingFileWriter();

  RotatingFileWriter(const RotatingFileWriter&) = delete;
  RotatingFileWriter& operator=(const RotatingFileWriter&) = delete;

  void Write(const LogRecord& record);

  // Flushes pending writes regardless of the threshold.
  void ForceFlush();

  void SetFormatter(std::unique_ptr<IFormatter> formatter) { formatter_ = std::move(formatter); }

  // Gate checked at the top of the rotation path; may be toggled from any
  // thread.
  void SetRotationPaused(bool paused) { rotation_paused_.store(paused, std::memory_order_relaxed); }
  bool RotationPaused() const { return rotation_paused_.load(std::memory_order_relaxed); }

  const std::string& FilePath() const { return file_.Path(); }
  const RotationConfig& Config() const { return config_; }
  const RotationThrottle& Throttle() const { return throttle_; }
  const WriteBuffer& Buffer() const { return write_buffer_; }
  bool TargetOpen() const { return file_.IsOpen(); }

  uint64_t RotationCount() const { return rotation_count_.load(std::memory_order_relaxed); }
  uint64_t WriteFailures() const { return write_failures_.load(std::memory_order_relaxed); }

 private:
  RotationConfig config_;
  std::unique_ptr<IRotationObserver> observer_;
  TargetFile file_;
  WriteBuffer write_buffer_;
  RotationThrottle throttle_;
  RotationExecutor executor_;
  std::unique_ptr<IFormatter> formatter_;

  std::atomic<bool> rotation_paused_{false};
  std::atomic<uint64_t> rotation_count_{0};
  std::atomic<uint64_t> write_failures_{0};
  bool degraded_ = false;
  bool append_failing_ = false;

  char line_buf_[ROTALOG_MAX_MSG_LEN + 128];

  bool EnsureOpen();
  void MaybeRotate();
};

}  // namespace rotalog
