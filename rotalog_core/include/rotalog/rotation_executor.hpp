#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

#include "archive_enumerator.hpp"
#include "archive_namer.hpp"
#include "rotation_config.hpp"
#include "rotation_observer.hpp"
#include "target_file.hpp"

namespace rotalog
{

struct RotationOutcome
{
  size_t renumbered = 0;
  bool archived = false;
  std::string archive_path;
  size_t evicted = 0;
  bool reopened = false;
};

// Performs one rotation of the target file:
//   1. renumber old archives (numbering policy only)
//   2. rename the target to its archive name
//   3. delete the oldest archives beyond max_archived_files
//   4. reopen an empty target
// A failing step is reported on stderr and the following steps still run.
// Nothing here throws.
class RotationExecutor
{
 public:
  // `observer` is not owned and may be null.
  RotationExecutor(const std::string& target_path, const RotationConfig& config,
                   IRotationObserver* observer);

  RotationOutcome Execute(TargetFile& file, uint64_t wall_ns);

  size_t RenumberArchives();
  bool ArchiveTarget(TargetFile& file, uint64_t wall_ns, std::string& archive_path);
  size_t EvictArchives();
  bool ReopenTarget(TargetFile& file);

  void SetObserver(IRotationObserver* observer) { observer_ = observer; }
  const RotationConfig& Config() const { return config_; }

 private:
  std::string target_path_;
  RotationConfig config_;
  IRotationObserver* observer_;
  ArchiveNamer namer_;
  ArchiveEnumerator enumerator_;
};

}  // namespace rotalog
