#pragma once
#include <cstdint>

#include "target_file.hpp"

namespace rotalog
{

// Counts appends that have not reached stable storage yet and syncs the
// target once `flush_threshold` of them are pending, or on a forced flush.
// A crash loses at most `flush_threshold` lines.
class WriteBuffer
{
 public:
  explicit WriteBuffer(uint32_t flush_threshold);

  void RecordWrite() { ++unsynced_; }

  bool ShouldFlush(bool force) const;

  // Syncs `file` when ShouldFlush(force). The counter is reset even when the
  // sync fails; the failure is reported on stderr. Returns true if a flush
  // was attempted.
  bool FlushIfNeeded(TargetFile& file, bool force = false);

  uint32_t Unsynced() const { return unsynced_; }
  uint32_t Threshold() const { return flush_threshold_; }
  uint64_t FlushCount() const { return flush_count_; }

 private:
  uint32_t flush_threshold_;
  uint32_t unsynced_ = 0;
  uint64_t flush_count_ = 0;
};

}  // namespace rotalog
