#include "rotalog/rotation_executor.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>

#include "rotalog/file_ops.hpp"

namespace rotalog
{

RotationExecutor::RotationExecutor(const std::string& target_path, const RotationConfig& config,
                                   IRotationObserver* observer)
    : target_path_(target_path),
      config_(config),
      observer_(observer),
      namer_(config.suffix_policy),
      enumerator_(target_path)
{
}

RotationOutcome RotationExecutor::Execute(TargetFile& file, uint64_t wall_ns)
{
  RotationOutcome outcome;
  outcome.renumbered = RenumberArchives();
  outcome.archived = ArchiveTarget(file, wall_ns, outcome.archive_path);
  outcome.evicted = EvictArchives();
  outcome.reopened = ReopenTarget(file);
  return outcome;
}

size_t RotationExecutor::RenumberArchives()
{
  if (config_.suffix_policy != SuffixPolicy::Numbering)
  {
    return 0;
  }

  // Oldest gets the highest generation, which frees ".1" for the target.
  std::vector<std::string> archives = enumerator_.ListOldestFirst();
  const size_t count = archives.size();
  size_t renamed = 0;
  for (size_t i = 0; i < count; ++i)
  {
    const std::string& from = archives[i];
    std::string to = ArchiveNamer::WithGeneration(from, static_cast<unsigned>(count + 1 - i));
    if (to == from || path_exists(to))
    {
      continue;  // never overwrite another archive
    }
    int err = rename_file(from, to);
    if (err != 0)
    {
      std::fprintf(stderr, "RotationExecutor: failed to renumber '%s' -> '%s': %s\n",
                   from.c_str(), to.c_str(), std::strerror(err));
      break;
    }
    ++renamed;
  }
  return renamed;
}

bool RotationExecutor::ArchiveTarget(TargetFile& file, uint64_t wall_ns,
                                     std::string& archive_path)
{
  file.Close();

  archive_path = namer_.NameFor(target_path_, wall_ns);
  int err = path_exists(archive_path) ? EEXIST : rename_file(target_path_, archive_path);
  if (err != 0)
  {
    std::fprintf(stderr, "RotationExecutor: failed to archive '%s' -> '%s': %s\n",
                 target_path_.c_str(), archive_path.c_str(), std::strerror(err));
    archive_path.clear();
    return false;
  }

  if (observer_)
  {
    observer_->OnArchived(target_path_, archive_path);
  }
  return true;
}

size_t RotationExecutor::EvictArchives()
{
  std::vector<std::string> archives = enumerator_.ListOldestFirst();
  const size_t keep = config_.max_archived_files;
  if (archives.size() <= keep)
  {
    return 0;
  }

  const size_t excess = archives.size() - keep;
  size_t removed = 0;
  for (size_t i = 0; i < excess; ++i)
  {
    int err = remove_file(archives[i]);
    if (err != 0)
    {
      std::fprintf(stderr, "RotationExecutor: failed to remove '%s': %s\n",
                   archives[i].c_str(), std::strerror(err));
      break;
    }
    ++removed;
    if (observer_)
    {
      observer_->OnArchiveRemoved(archives[i]);
    }
  }
  return removed;
}

bool RotationExecutor::ReopenTarget(TargetFile& file)
{
  int err = file.Open();
  if (err != 0)
  {
    std::fprintf(stderr, "RotationExecutor: failed to reopen '%s': %s\n",
                 target_path_.c_str(), std::strerror(err));
    return false;
  }
  return true;
}

}  // namespace rotalog
