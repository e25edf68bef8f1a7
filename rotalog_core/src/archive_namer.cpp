#include "rotalog/archive_namer.hpp"

#include <fmt/format.h>

#include "rotalog/file_ops.hpp"
#include "rotalog/timestamp.hpp"

namespace rotalog
{

namespace
{

uint64_t seed_from_device()
{
  std::random_device rd;
  return (static_cast<uint64_t>(rd()) << 32) ^ static_cast<uint64_t>(rd()) ^ monotonic_now_ns();
}

}  // namespace

ArchiveNamer::ArchiveNamer(SuffixPolicy policy) : policy_(policy), rng_(seed_from_device()) {}

std::string ArchiveNamer::NameFor(const std::string& target_path, uint64_t wall_ns)
{
  switch (policy_)
  {
    case SuffixPolicy::Numbering:
      return target_path + ".1";
    case SuffixPolicy::DateUuid:
    {
      char stamp[32];
      size_t len = format_archive_stamp(wall_ns, stamp, sizeof(stamp));
      return fmt::format("{}.{}_{}", target_path, std::string_view(stamp, len), NextUniqueId());
    }
  }
  return target_path + ".1";
}

std::string ArchiveNamer::NextUniqueId()
{
  uint64_t hi = rng_();
  uint64_t lo = rng_();
  hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;  // version 4
  lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;  // RFC 4122 variant
  return fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}", hi >> 32, (hi >> 16) & 0xFFFF,
                     hi & 0xFFFF, lo >> 48, lo & 0xFFFFFFFFFFFFULL);
}

std::string ArchiveNamer::WithGeneration(const std::string& archive_path, unsigned generation)
{
  return fmt::format("{}.{}", strip_extension(archive_path), generation);
}

}  // namespace rotalog
