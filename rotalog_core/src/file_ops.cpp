#include "rotalog/file_ops.hpp"

#include <dirent.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>

#include "rotalog/platform.hpp"

namespace rotalog
{

namespace
{

bool is_separator(char c) { return c == '/'; }

size_t last_separator(const std::string& path)
{
  for (size_t i = path.size(); i > 0; --i)
  {
    if (is_separator(path[i - 1]))
    {
      return i - 1;
    }
  }
  return std::string::npos;
}

}  // namespace

int stat_file(const std::string& path, FileStat& out)
{
  struct stat st{};
  if (::stat(path.c_str(), &st) != 0)
  {
    return errno;
  }
  out.size = static_cast<uint64_t>(st.st_size);
#if defined(ROTALOG_PLATFORM_MACOS)
  out.mtime_ns = static_cast<int64_t>(st.st_mtimespec.tv_sec) * 1'000'000'000LL +
                 st.st_mtimespec.tv_nsec;
#else
  out.mtime_ns = static_cast<int64_t>(st.st_mtim.tv_sec) * 1'000'000'000LL +
                 st.st_mtim.tv_nsec;
#endif
  out.is_directory = S_ISDIR(st.st_mode);
  return 0;
}

int list_directory(const std::string& dir, std::vector<std::string>& names)
{
  DIR* d = ::opendir(dir.c_str());
  if (!d)
  {
    return errno;
  }
  struct dirent* ent;
  errno = 0;
  while ((ent = ::readdir(d)) != nullptr)
  {
    std::string name(ent->d_name);
    if (name == "." || name == "..") continue;
    names.push_back(std::move(name));
  }
  int err = errno;
  ::closedir(d);
  return err;
}

int rename_file(const std::string& from, const std::string& to)
{
  return std::rename(from.c_str(), to.c_str()) == 0 ? 0 : errno;
}

int remove_file(const std::string& path)
{
  return ::unlink(path.c_str()) == 0 ? 0 : errno;
}

bool path_exists(const std::string& path)
{
  struct stat st{};
  return ::lstat(path.c_str(), &st) == 0;
}

static int make_one_directory(const std::string& path)
{
  if (::mkdir(path.c_str(), 0755) != 0 && errno != EEXIST)
  {
    return errno;
  }
  return 0;
}

int make_directories(const std::string& path)
{
  if (path.empty() || path == ".")
  {
    return 0;
  }
  std::string partial;
  for (size_t i = 0; i < path.size(); ++i)
  {
    partial += path[i];
    bool end_of_component = (i + 1 == path.size()) || is_separator(path[i + 1]);
    if (!end_of_component || is_separator(path[i]))
    {
      continue;
    }
    int err = make_one_directory(partial);
    if (err != 0)
    {
      return err;
    }
  }
  FileStat st{};
  int err = stat_file(path, st);
  if (err != 0)
  {
    return err;
  }
  return st.is_directory ? 0 : ENOTDIR;
}

std::string parent_directory(const std::string& path)
{
  size_t pos = last_separator(path);
  if (pos == std::string::npos)
  {
    return ".";
  }
  if (pos == 0)
  {
    return path.substr(0, 1);
  }
  return path.substr(0, pos);
}

std::string base_name(const std::string& path)
{
  size_t pos = last_separator(path);
  return pos == std::string::npos ? path : path.substr(pos + 1);
}

std::string join_path(const std::string& dir, const std::string& name)
{
  if (dir.empty())
  {
    return name;
  }
  if (is_separator(dir.back()))
  {
    return dir + name;
  }
  return dir + "/" + name;
}

std::string strip_extension(const std::string& path)
{
  size_t sep = last_separator(path);
  size_t name_start = (sep == std::string::npos) ? 0 : sep + 1;
  size_t dot = path.rfind('.');
  if (dot == std::string::npos || dot <= name_start || dot + 1 == path.size())
  {
    return path;
  }
  return path.substr(0, dot);
}

}  // namespace rotalog
