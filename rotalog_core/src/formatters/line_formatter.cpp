#include "rotalog/formatters/line_formatter.hpp"

#include <fmt/format.h>

#include <string_view>

#include "rotalog/timestamp.hpp"

namespace rotalog
{

LineFormatter::LineFormatter(bool with_timestamp) : with_timestamp_(with_timestamp) {}

size_t LineFormatter::Format(const LogRecord& record, char* buf, size_t buf_size)
{
  if (buf_size == 0)
  {
    return 0;
  }

  std::string_view msg(record.msg, record.msg_len);
  fmt::format_to_n_result<char*> result{};
  if (with_timestamp_)
  {
    char ts[48];
    size_t ts_len = format_timestamp(record.wall_clock_ns, ts, sizeof(ts));
    result = fmt::format_to_n(buf, buf_size - 1, "[{}] [{}] {}", std::string_view(ts, ts_len),
                              to_string(record.level), msg);
  }
  else
  {
    result = fmt::format_to_n(buf, buf_size - 1, "[{}] {}", to_string(record.level), msg);
  }

  size_t len = result.size < buf_size - 1 ? result.size : buf_size - 1;
  buf[len] = '\0';
  return len;
}

}  // namespace rotalog
