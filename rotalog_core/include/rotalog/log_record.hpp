#pragma once
#include <cstdint>
#include <type_traits>

#include "log_level.hpp"
#include "platform.hpp"

namespace rotalog
{

struct LogRecord
{
  uint64_t timestamp_ns;
  uint64_t wall_clock_ns;

  LogLevel level;

  uint64_t sequence_id;

  uint16_t msg_len;
  char msg[ROTALOG_MAX_MSG_LEN];
};

static_assert(std::is_trivially_copyable_v<LogRecord>,
              "LogRecord must be trivially copyable for the lock-free record queue");

}  // namespace rotalog
