#include "rotalog/backend.hpp"

#if ROTALOG_HAS_THREAD
#include <chrono>
#endif

namespace rotalog
{

LoggerBackend::LoggerBackend(std::unique_ptr<RotatingFileWriter> writer)
    : writer_(std::move(writer))
{
}

LoggerBackend::~LoggerBackend() { Stop(); }

bool LoggerBackend::TryPush(const LogRecord& record) { return queue_.TryPush(record); }

void LoggerBackend::Start()
{
  if (running_.load(std::memory_order_relaxed))
  {
    return;
  }
  running_.store(true, std::memory_order_relaxed);
#if ROTALOG_HAS_THREAD
  worker_ = std::thread(&LoggerBackend::WorkerLoop, this);
#endif
}

void LoggerBackend::Stop()
{
  running_.store(false, std::memory_order_relaxed);
#if ROTALOG_HAS_THREAD
  if (worker_.joinable())
  {
    worker_.join();
  }
#endif
  while (Drain(64) > 0)
  {
  }
  writer_->ForceFlush();
}

void LoggerBackend::ServeFlushRequest()
{
  if (flush_requested_.exchange(false, std::memory_order_acq_rel))
  {
    writer_->ForceFlush();
  }
}

size_t LoggerBackend::Drain(size_t max_records)
{
  ServeFlushRequest();

  size_t count = 0;
  LogRecord record{};
  while (count < max_records && queue_.TryPop(record))
  {
    writer_->Write(record);
    ++count;
  }
  return count;
}

#if ROTALOG_HAS_THREAD
void LoggerBackend::WorkerLoop()
{
  uint32_t idle_count = 0;
  while (running_.load(std::memory_order_relaxed))
  {
    size_t drained = Drain(64);
    if (drained > 0)
    {
      idle_count = 0;
    }
    else
    {
      ++idle_count;
      if (idle_count < 100)
      {
        // busy spin
      }
      else if (idle_count < 1000)
      {
        std::this_thread::yield();
      }
      else
      {
        std::this_thread::sleep_for(std::chrono::microseconds(100));
      }
    }
  }
  while (Drain(64) > 0)
  {
  }
}
#endif

}  // namespace rotalog
