#include "rotalog/file_rotation_logger.hpp"

namespace rotalog
{

FileRotationLogger::FileRotationLogger(const std::string& file_path,
                                       const RotationConfig& config,
                                       std::unique_ptr<IRotationObserver> observer,
                                       std::string_view file_permission,
                                       const RotationTuning& tuning)
    : backend_(std::make_unique<LoggerBackend>(std::make_unique<RotatingFileWriter>(
          file_path, file_permission, config, tuning, std::move(observer))))
{
}

FileRotationLogger::~FileRotationLogger() { Stop(); }

void FileRotationLogger::Log(LogLevel level, std::string_view message)
{
  if (level < Level() || level == LogLevel::Off)
  {
    return;
  }

  LogRecord record{};
  record.level = level;
  size_t len = message.size() < ROTALOG_MAX_MSG_LEN - 1 ? message.size() : ROTALOG_MAX_MSG_LEN - 1;
  if (len > 0)
  {
    std::memcpy(record.msg, message.data(), len);
  }
  record.msg[len] = '\0';
  record.msg_len = static_cast<uint16_t>(len);
  Enqueue(record);
}

void FileRotationLogger::Enqueue(LogRecord& record)
{
  record.timestamp_ns = monotonic_now_ns();
  record.wall_clock_ns = wall_clock_now_ns();
  record.sequence_id = sequence_.fetch_add(1, std::memory_order_relaxed);

  if (!backend_->TryPush(record))
  {
    drop_count_.fetch_add(1, std::memory_order_relaxed);
  }
}

void FileRotationLogger::SetLevel(LogLevel level) { level_.store(level, std::memory_order_relaxed); }

LogLevel FileRotationLogger::Level() const { return level_.load(std::memory_order_relaxed); }

void FileRotationLogger::SetFormatter(std::unique_ptr<IFormatter> formatter)
{
  backend_->Writer().SetFormatter(std::move(formatter));
}

void FileRotationLogger::Start()
{
  if (started_)
  {
    return;
  }
  backend_->Start();
  started_ = true;
}

void FileRotationLogger::Stop()
{
  backend_->Stop();
  started_ = false;
}

size_t FileRotationLogger::Drain(size_t max_records) { return backend_->Drain(max_records); }

void FileRotationLogger::RequestFlush() { backend_->RequestFlush(); }

void FileRotationLogger::SetRotationPaused(bool paused)
{
  backend_->Writer().SetRotationPaused(paused);
}

bool FileRotationLogger::RotationPaused() const { return backend_->Writer().RotationPaused(); }

void FileRotationLogger::OnEnterBackground()
{
  SetRotationPaused(true);
  RequestFlush();
}

void FileRotationLogger::OnEnterForeground() { SetRotationPaused(false); }

const std::string& FileRotationLogger::FilePath() const { return backend_->Writer().FilePath(); }

const RotationConfig& FileRotationLogger::Config() const { return backend_->Writer().Config(); }

uint64_t FileRotationLogger::RotationCount() const { return backend_->Writer().RotationCount(); }

uint64_t FileRotationLogger::WriteFailures() const { return backend_->Writer().WriteFailures(); }

}  // namespace rotalog
