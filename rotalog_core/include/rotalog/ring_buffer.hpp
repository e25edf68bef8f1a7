#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <type_traits>

#include "platform.hpp"

namespace rotalog
{

// Bounded multi-producer / single-consumer queue. Producers never block: a
// full queue makes TryPush return false. Only the owning serial context
// may call TryPop.
template <typename T, size_t Capacity>
class MPSCRingBuffer
{
  static_assert(Capacity >= 2 && (Capacity & (Capacity - 1)) == 0,
                "Capacity must be a power of 2");
  static_assert(std::is_trivially_copyable_v<T>, "T must be trivially copyable");

 public:
  MPSCRingBuffer() : write_pos_(0), read_pos_(0)
  {
    for (uint32_t i = 0; i < Capacity; ++i)
    {
      buffer_[i].sequence.store(i, std::memory_order_relaxed);
    }
  }

  MPSCRingBuffer(const MPSCRingBuffer&) = delete;
  MPSCRingBuffer& operator=(const MPSCRingBuffer&) = delete;

  bool TryPush(const T& item)
  {
    uint32_t pos = write_pos_.load(std::memory_order_relaxed);
    for (;;)
    {
      Slot& slot = buffer_[pos & kMask];
      uint32_t seq = slot.sequence.load(std::memory_order_acquire);
      // signed distance keeps the full check correct across uint32_t wraparound
      int32_t diff = static_cast<int32_t>(seq - pos);
      if (diff == 0)
      {
        if (write_pos_.compare_exchange_weak(pos, pos + 1, std::memory_order_relaxed,
                                             std::memory_order_relaxed))
        {
          slot.value = item;
          slot.sequence.store(pos + 1, std::memory_order_release);
          return true;
        }
      }
      else if (diff < 0)
      {
        return false;  // full
      }
      else
      {
        pos = write_pos_.load(std::memory_order_relaxed);
      }
    }
  }

  bool TryPop(T& item)
  {
    Slot& slot = buffer_[read_pos_ & kMask];
    if (slot.sequence.load(std::memory_order_acquire) != read_pos_ + 1)
    {
      return false;
    }
    item = slot.value;
    slot.sequence.store(read_pos_ + static_cast<uint32_t>(Capacity), std::memory_order_release);
    ++read_pos_;
    return true;
  }

  bool Empty() const
  {
    const Slot& slot = buffer_[read_pos_ & kMask];
    return slot.sequence.load(std::memory_order_acquire) != read_pos_ + 1;
  }

  static constexpr size_t GetCapacity() { return Capacity; }

 private:
  static constexpr uint32_t kMask = static_cast<uint32_t>(Capacity - 1);

  struct alignas(ROTALOG_CACHELINE_SIZE) Slot
  {
    std::atomic<uint32_t> sequence;
    T value;
  };

  alignas(ROTALOG_CACHELINE_SIZE) Slot buffer_[Capacity];
  alignas(ROTALOG_CACHELINE_SIZE) std::atomic<uint32_t> write_pos_;
  alignas(ROTALOG_CACHELINE_SIZE) uint32_t read_pos_;
};

}  // namespace rotalog
