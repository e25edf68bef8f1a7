#include "rotalog/rotating_file_writer.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <system_error>

#include "rotalog/file_ops.hpp"
#include "rotalog/formatters/line_formatter.hpp"
#include "rotalog/timestamp.hpp"

namespace rotalog
{

namespace
{

uint32_t checked_permission(std::string_view file_permission)
{
  uint32_t mode = 0;
  if (!parse_file_permission(file_permission, mode))
  {
    throw std::invalid_argument("rotalog: invalid file permission '" +
                                std::string(file_permission) + "'");
  }
  return mode;
}

const std::string& checked_path(const std::string& file_path)
{
  if (file_path.empty())
  {
    throw std::invalid_argument("rotalog: empty file path");
  }
  char last = file_path.back();
  if (last == '/' || base_name(file_path) == "." ||
      base_name(file_path) == "..")
  {
    throw std::invalid_argument("rotalog: '" + file_path + "' names a directory");
  }
  FileStat st{};
  if (stat_file(file_path, st) == 0 && st.is_directory)
  {
    throw std::invalid_argument("rotalog: '" + file_path + "' is a directory");
  }
  return file_path;
}

}  // namespace

RotatingFileWriter::RotatingFileWriter(const std::string& file_path,
                                       std::string_view file_permission,
                                       const RotationConfig& config,
                                       const RotationTuning& tuning,
                                       std::unique_ptr<IRotationObserver> observer)
    : config_(config),
      observer_(std::move(observer)),
      file_(checked_path(file_path), checked_permission(file_permission)),
      write_buffer_(tuning.flush_threshold),
      throttle_(tuning.check_frequency, tuning.check_interval),
      executor_(file_path, config, observer_.get())
{
  int err = make_directories(parent_directory(file_path));
  if (err != 0)
  {
    throw std::system_error(err, std::generic_category(),
                            "rotalog: cannot create directory for '" + file_path + "'");
  }
  err = file_.Open();
  if (err != 0)
  {
    throw std::system_error(err, std::generic_category(),
                            "rotalog: cannot open '" + file_path + "'");
  }
}

RotatingFileWriter::~RotatingFileWriter() { ForceFlush(); }

bool RotatingFileWriter::EnsureOpen()
{
  if (file_.IsOpen())
  {
    return true;
  }

  // Lazy recovery after a failed reopen: retry on every write, report only
  // the transitions.
  int err = file_.Open();
  if (err != 0)
  {
    if (!degraded_)
    {
      std::fprintf(stderr, "RotatingFileWriter: '%s' unavailable, dropping lines: %s\n",
                   file_.Path().c_str(), std::strerror(err));
      degraded_ = true;
    }
    return false;
  }
  if (degraded_)
  {
    std::fprintf(stderr, "RotatingFileWriter: '%s' reopened\n", file_.Path().c_str());
    degraded_ = false;
  }
  return true;
}

void RotatingFileWriter::Write(const LogRecord& record)
{
  if (!formatter_)
  {
    formatter_ = std::make_unique<LineFormatter>();
  }

  if (!EnsureOpen())
  {
    write_failures_.fetch_add(1, std::memory_order_relaxed);
    return;
  }

  size_t len = formatter_->Format(record, line_buf_, sizeof(line_buf_) - 1);
  line_buf_[len] = '\n';

  int err = file_.Append(line_buf_, len + 1);
  if (err != 0)
  {
    write_failures_.fetch_add(1, std::memory_order_relaxed);
    if (!append_failing_)
    {
      std::fprintf(stderr, "RotatingFileWriter: failed to append to '%s': %s\n",
                   file_.Path().c_str(), std::strerror(err));
      append_failing_ = true;
    }
  }
  else
  {
    append_failing_ = false;
    write_buffer_.RecordWrite();
    write_buffer_.FlushIfNeeded(file_);
  }

  MaybeRotate();
}

void RotatingFileWriter::ForceFlush() { write_buffer_.FlushIfNeeded(file_, true); }

void RotatingFileWriter::MaybeRotate()
{
  if (RotationPaused())
  {
    return;
  }

  if (!throttle_.OnCall(RotationThrottle::Clock::now()))
  {
    return;
  }

  FileStat st{};
  int err = stat_file(file_.Path(), st);
  if (err != 0)
  {
    if (err != ENOENT)
    {
      std::fprintf(stderr, "RotatingFileWriter: cannot stat '%s': %s\n",
                   file_.Path().c_str(), std::strerror(err));
    }
    return;
  }
  if (st.size <= config_.max_file_size)
  {
    return;
  }

  // Everything written so far belongs to the archive.
  ForceFlush();
  RotationOutcome outcome = executor_.Execute(file_, wall_clock_now_ns());
  if (!outcome.reopened)
  {
    degraded_ = true;
  }
  rotation_count_.fetch_add(1, std::memory_order_relaxed);
}

}  // namespace rotalog
