#pragma once
#include <chrono>
#include <cstdint>
#include <string_view>

#include "platform.hpp"

namespace rotalog
{

enum class SuffixPolicy : uint8_t
{
  Numbering,  // <target>.1, <target>.2, ... (1 = most recent)
  DateUuid    // <target>.<yyyyMMdd'T'HHmmssZ>_<uuid>
};

constexpr std::string_view to_string(SuffixPolicy policy)
{
  switch (policy)
  {
    case SuffixPolicy::Numbering:
      return "numbering";
    case SuffixPolicy::DateUuid:
      return "date_uuid";
  }
  return "unknown";
}

struct RotationConfig
{
  SuffixPolicy suffix_policy = SuffixPolicy::Numbering;
  uint64_t max_file_size = ROTALOG_DEFAULT_MAX_FILE_SIZE;
  // Enforced at eviction time only; 0 evicts every archive.
  uint8_t max_archived_files = ROTALOG_DEFAULT_MAX_ARCHIVES;
};

// Knobs of the write path. The defaults are what production callers want;
// tests shrink them.
struct RotationTuning
{
  uint64_t check_frequency = ROTALOG_CHECK_FREQUENCY;
  std::chrono::nanoseconds check_interval = std::chrono::seconds(ROTALOG_CHECK_INTERVAL_SEC);
  uint32_t flush_threshold = ROTALOG_FLUSH_THRESHOLD;
};

}  // namespace rotalog
