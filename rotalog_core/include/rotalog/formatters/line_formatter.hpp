#pragma once
#include "formatter_interface.hpp"

namespace rotalog
{

// "[YYYY-MM-DD HH:MM:SS.uuuuuu] [LEVEL] message", local time.
class LineFormatter : public IFormatter
{
 public:
  explicit LineFormatter(bool with_timestamp = true);

  size_t Format(const LogRecord& record, char* buf, size_t buf_size) override;

 private:
  bool with_timestamp_;
};

}  // namespace rotalog
