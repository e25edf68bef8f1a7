#include "rotalog/archive_enumerator.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <cstring>

#include "rotalog/file_ops.hpp"

namespace rotalog
{

namespace
{

// Numeric suffix of "<target>.<N>", or -1.
long generation_of(const std::string& path)
{
  size_t dot = path.rfind('.');
  if (dot == std::string::npos || dot + 1 == path.size() || path.size() - dot > 10)
  {
    return -1;
  }
  long n = 0;
  for (size_t i = dot + 1; i < path.size(); ++i)
  {
    if (path[i] < '0' || path[i] > '9') return -1;
    n = n * 10 + (path[i] - '0');
  }
  return n;
}

}  // namespace

ArchiveEnumerator::ArchiveEnumerator(std::string target_path)
    : target_path_(std::move(target_path)),
      directory_(parent_directory(target_path_)),
      target_name_(base_name(target_path_))
{
  path_prefix_ = target_path_.substr(0, target_path_.size() - target_name_.size());
}

bool ArchiveEnumerator::IsArchiveName(const std::string& entry_name) const
{
  return entry_name != target_name_ && strip_extension(entry_name) == target_name_;
}

std::vector<std::string> ArchiveEnumerator::ListOldestFirst() const
{
  struct Candidate
  {
    std::string path;
    int64_t mtime_ns;
    long generation;
  };

  std::vector<std::string> names;
  int err = list_directory(directory_, names);
  if (err != 0)
  {
    std::fprintf(stderr, "ArchiveEnumerator: cannot list '%s': %s\n", directory_.c_str(),
                 std::strerror(err));
    return {};
  }

  std::vector<Candidate> candidates;
  for (const auto& name : names)
  {
    if (!IsArchiveName(name))
    {
      continue;
    }
    std::string path = path_prefix_ + name;
    FileStat st{};
    err = stat_file(path, st);
    if (err != 0)
    {
      std::fprintf(stderr, "ArchiveEnumerator: cannot stat '%s': %s\n", path.c_str(),
                   std::strerror(err));
      return {};
    }
    if (st.is_directory)
    {
      continue;
    }
    long generation = generation_of(path);
    candidates.push_back({std::move(path), st.mtime_ns, generation});
  }

  std::sort(candidates.begin(), candidates.end(),
            [](const Candidate& a, const Candidate& b)
            {
              if (a.mtime_ns != b.mtime_ns) return a.mtime_ns < b.mtime_ns;
              // same mtime: numbered archives first, higher generation is older
              bool a_numbered = a.generation >= 0;
              bool b_numbered = b.generation >= 0;
              if (a_numbered != b_numbered) return a_numbered;
              if (a.generation != b.generation) return a.generation > b.generation;
              return a.path < b.path;
            });

  std::vector<std::string> result;
  result.reserve(candidates.size());
  for (auto& c : candidates)
  {
    result.push_back(std::move(c.path));
  }
  return result;
}

}  // namespace rotalog
