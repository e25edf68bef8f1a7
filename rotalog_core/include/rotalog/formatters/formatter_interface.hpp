#pragma once
#include <cstddef>

#include "../log_record.hpp"

namespace rotalog
{

class IFormatter
{
 public:
  virtual ~IFormatter() = default;
  // Writes one line without the trailing newline; returns its length.
  virtual size_t Format(const LogRecord& record, char* buf, size_t buf_size) = 0;
};

}  // namespace rotalog
