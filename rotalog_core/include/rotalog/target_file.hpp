#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace rotalog
{

// Parses an octal permission string such as "640" or "0600" (1-4 digits,
// each 0-7, no setuid/setgid/sticky bits). Returns false on anything else.
bool parse_file_permission(std::string_view text, uint32_t& mode);

// Append-only handle on the file currently receiving log lines. Every call
// returns 0 or an errno value and never throws.
class TargetFile
{
 public:
  TargetFile(std::string path, uint32_t mode);
  ~TargetFile();

  TargetFile(const TargetFile&) = delete;
  TargetFile& operator=(const TargetFile&) = delete;

  // Opens for append, creating the file with `mode` if it does not exist.
  int Open();
  void Close();
  bool IsOpen() const { return fd_ >= 0; }

  int Append(const char* data, size_t len);
  int Sync();

  const std::string& Path() const { return path_; }
  uint32_t Mode() const { return mode_; }

 private:
  std::string path_;
  uint32_t mode_;
  int fd_;
};

}  // namespace rotalog
