#include "rotalog/write_buffer.hpp"

#include <cstdio>
#include <cstring>

namespace rotalog
{

WriteBuffer::WriteBuffer(uint32_t flush_threshold) : flush_threshold_(flush_threshold) {}

bool WriteBuffer::ShouldFlush(bool force) const
{
  return (force && unsynced_ > 0) || unsynced_ >= flush_threshold_;
}

bool WriteBuffer::FlushIfNeeded(TargetFile& file, bool force)
{
  if (!ShouldFlush(force))
  {
    return false;
  }

  int err = file.IsOpen() ? file.Sync() : 0;
  if (err != 0)
  {
    std::fprintf(stderr, "WriteBuffer: failed to sync '%s': %s\n", file.Path().c_str(),
                 std::strerror(err));
  }
  unsynced_ = 0;
  ++flush_count_;
  return true;
}

}  // namespace rotalog
