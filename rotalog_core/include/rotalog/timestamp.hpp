#pragma once
#include <cstddef>
#include <cstdint>

namespace rotalog
{

uint64_t monotonic_now_ns();
uint64_t wall_clock_now_ns();

// "YYYY-MM-DD HH:MM:SS.uuuuuu", local time
size_t format_timestamp(uint64_t wall_ns, char* buf, size_t buf_size);

// "yyyyMMdd'T'HHmmssZ", always UTC; fixed width (16 chars)
size_t format_archive_stamp(uint64_t wall_ns, char* buf, size_t buf_size);

}  // namespace rotalog
