#pragma once
#include <cstdint>
#include <random>
#include <string>

#include "rotation_config.hpp"

namespace rotalog
{

class ArchiveNamer
{
 public:
  explicit ArchiveNamer(SuffixPolicy policy);

  // Path the target is renamed to when it is archived at wall time `wall_ns`.
  // Numbering always yields "<target>.1"; the renumber pass frees that slot.
  std::string NameFor(const std::string& target_path, uint64_t wall_ns);

  // Lowercase RFC 4122 version 4 UUID.
  std::string NextUniqueId();

  SuffixPolicy Policy() const { return policy_; }

  // "<target>.<generation>" for an archive currently at "<target>.<any>".
  static std::string WithGeneration(const std::string& archive_path, unsigned generation);

 private:
  SuffixPolicy policy_;
  std::mt19937_64 rng_;
};

}  // namespace rotalog
