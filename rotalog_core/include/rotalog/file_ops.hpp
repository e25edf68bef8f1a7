#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace rotalog
{

// POSIX filesystem primitives used by the rotation engine. Every call returns 0 on
// success or an errno-style code; none of them throw.

struct FileStat
{
  uint64_t size;
  int64_t mtime_ns;  // since the Unix epoch
  bool is_directory;
};

int stat_file(const std::string& path, FileStat& out);

// Entry names only ("." and ".." excluded), in directory order.
int list_directory(const std::string& dir, std::vector<std::string>& names);

int rename_file(const std::string& from, const std::string& to);
int remove_file(const std::string& path);
bool path_exists(const std::string& path);

// mkdir -p, mode 0755
int make_directories(const std::string& path);

// "/var/log/app.log" -> "/var/log"; "app.log" -> "."
std::string parent_directory(const std::string& path);
// "/var/log/app.log" -> "app.log"
std::string base_name(const std::string& path);
std::string join_path(const std::string& dir, const std::string& name);

// Removes the last extension of the final path component.
// "app.log.3" -> "app.log"; ".profile" and "app" are returned unchanged.
std::string strip_extension(const std::string& path);

}  // namespace rotalog
