#pragma once
#include <dirent.h>
#include <fcntl.h>
#include <gtest/gtest.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

// Shared helpers for tests that touch the filesystem.
namespace rotalog_test
{

inline std::string read_file(const std::string& path)
{
  std::ifstream ifs(path);
  if (!ifs) return "";
  std::ostringstream ss;
  ss << ifs.rdbuf();
  return ss.str();
}

inline void write_file(const std::string& path, const std::string& content)
{
  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  ofs << content;
}

inline bool file_exists(const std::string& path)
{
  struct stat st{};
  return ::stat(path.c_str(), &st) == 0;
}

inline size_t file_size(const std::string& path)
{
  struct stat st{};
  if (::stat(path.c_str(), &st) != 0) return 0;
  return static_cast<size_t>(st.st_size);
}

// Pins both atime and mtime to `seconds` since the epoch.
inline bool set_mtime(const std::string& path, time_t seconds)
{
  struct timespec times[2];
  times[0].tv_sec = seconds;
  times[0].tv_nsec = 0;
  times[1].tv_sec = seconds;
  times[1].tv_nsec = 0;
  return ::utimensat(AT_FDCWD, path.c_str(), times, 0) == 0;
}

inline std::vector<std::string> list_names(const std::string& dir)
{
  std::vector<std::string> names;
  DIR* d = ::opendir(dir.c_str());
  if (!d) return names;
  struct dirent* ent;
  while ((ent = ::readdir(d)) != nullptr)
  {
    std::string name = ent->d_name;
    if (name == "." || name == "..") continue;
    names.push_back(name);
  }
  ::closedir(d);
  std::sort(names.begin(), names.end());
  return names;
}

inline void remove_dir_recursive(const std::string& path)
{
  DIR* d = ::opendir(path.c_str());
  if (!d) return;
  struct dirent* ent;
  while ((ent = ::readdir(d)) != nullptr)
  {
    std::string name = ent->d_name;
    if (name == "." || name == "..") continue;
    std::string full = path + "/" + name;
    struct stat st{};
    if (::lstat(full.c_str(), &st) == 0 && S_ISDIR(st.st_mode))
    {
      remove_dir_recursive(full);
    }
    else
    {
      std::remove(full.c_str());
    }
  }
  ::closedir(d);
  ::rmdir(path.c_str());
}

// Fixture owning a fresh directory under /tmp with "app.log" as target.
class TempDirTest : public ::testing::Test
{
 protected:
  std::string tmp_dir_;
  std::string target_;

  void SetUp() override
  {
    char tmpl[] = "/tmp/rotalog_test_XXXXXX";
    char* dir = ::mkdtemp(tmpl);
    ASSERT_NE(dir, nullptr);
    tmp_dir_ = dir;
    target_ = tmp_dir_ + "/app.log";
  }

  void TearDown() override { remove_dir_recursive(tmp_dir_); }
};

}  // namespace rotalog_test
