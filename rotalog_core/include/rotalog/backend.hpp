#pragma once
#include <atomic>
#include <memory>

#include "log_record.hpp"
#include "platform.hpp"
#include "ring_buffer.hpp"
#include "rotating_file_writer.hpp"

#if ROTALOG_HAS_THREAD
#include <thread>
#endif

namespace rotalog
{

// Serial execution context of one logger: producers push records into a
// bounded queue, a single consumer (the worker thread, or the caller of
// Drain in thread-less mode) feeds them to the writer in order.
class LoggerBackend
{
 public:
  explicit LoggerBackend(std::unique_ptr<RotatingFileWriter> writer);
  ~LoggerBackend();

  LoggerBackend(const LoggerBackend&) = delete;
  LoggerBackend& operator=(const LoggerBackend&) = delete;

  // Producer side, any thread. False when the queue is full.
  bool TryPush(const LogRecord& record);

  // Served by the consumer before the next queued record.
  void RequestFlush() { flush_requested_.store(true, std::memory_order_release); }

  void Start();
  void Stop();  // joins the worker, drains what is left, forces a flush

  // Consumer side when no worker runs.
  size_t Drain(size_t max_records = 64);

  RotatingFileWriter& Writer() { return *writer_; }
  const RotatingFileWriter& Writer() const { return *writer_; }
  bool Running() const { return running_.load(std::memory_order_relaxed); }

 private:
  MPSCRingBuffer<LogRecord, ROTALOG_QUEUE_SIZE> queue_;
  std::unique_ptr<RotatingFileWriter> writer_;
  std::atomic<bool> running_{false};
  std::atomic<bool> flush_requested_{false};

#if ROTALOG_HAS_THREAD
  std::thread worker_;
  void WorkerLoop();
#endif

  void ServeFlushRequest();
};

}  // namespace rotalog
