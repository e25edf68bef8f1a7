#pragma once
#include <string>
#include <vector>

namespace rotalog
{

// Finds the archives of one target file: every sibling whose path, with its
// last extension removed, equals the target path. The target itself and
// unrelated siblings are excluded.
class ArchiveEnumerator
{
 public:
  explicit ArchiveEnumerator(std::string target_path);

  // Oldest first by modification time. Ties go to the higher generation
  // number for numbered archives, then to the name. Any filesystem
  // failure is reported on stderr and yields an empty list.
  std::vector<std::string> ListOldestFirst() const;

  bool IsArchiveName(const std::string& entry_name) const;

 private:
  std::string target_path_;
  std::string directory_;
  std::string path_prefix_;  // directory part of target_path_, separator included
  std::string target_name_;
};

}  // namespace rotalog
