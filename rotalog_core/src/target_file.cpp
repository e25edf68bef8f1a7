#include "rotalog/target_file.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>

#include "rotalog/platform.hpp"

namespace rotalog
{

bool parse_file_permission(std::string_view text, uint32_t& mode)
{
  if (text.empty() || text.size() > 4)
  {
    return false;
  }
  uint32_t value = 0;
  for (char c : text)
  {
    if (c < '0' || c > '7')
    {
      return false;
    }
    value = value * 8 + static_cast<uint32_t>(c - '0');
  }
  // setuid, setgid and sticky bits have no business on a log file
  if ((value & 07000) != 0)
  {
    return false;
  }
  mode = value;
  return true;
}

TargetFile::TargetFile(std::string path, uint32_t mode)
    : path_(std::move(path)), mode_(mode), fd_(-1)
{
}

TargetFile::~TargetFile()
{
  if (fd_ >= 0)
  {
    ::fsync(fd_);
    ::close(fd_);
    fd_ = -1;
  }
}

int TargetFile::Open()
{
  Close();

  bool created = true;
  fd_ = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_APPEND,
               static_cast<mode_t>(mode_));
  if (fd_ < 0 && errno == EEXIST)
  {
    created = false;
    fd_ = ::open(path_.c_str(), O_WRONLY | O_APPEND);
  }
  if (fd_ < 0)
  {
    return errno;
  }

  // open() is subject to the umask; a fresh file gets exactly `mode_`.
  if (created && ::fchmod(fd_, static_cast<mode_t>(mode_)) != 0)
  {
    int err = errno;
    ::close(fd_);
    fd_ = -1;
    return err;
  }
  return 0;
}

void TargetFile::Close()
{
  if (fd_ >= 0)
  {
    ::close(fd_);
    fd_ = -1;
  }
}

int TargetFile::Append(const char* data, size_t len)
{
  if (fd_ < 0)
  {
    return EBADF;
  }
  while (len > 0)
  {
    ssize_t written = ::write(fd_, data, len);
    if (written < 0)
    {
      if (errno == EINTR) continue;
      return errno;
    }
    data += written;
    len -= static_cast<size_t>(written);
  }
  return 0;
}

int TargetFile::Sync()
{
  if (fd_ < 0)
  {
    return EBADF;
  }
#if defined(ROTALOG_PLATFORM_LINUX)
  return ::fdatasync(fd_) == 0 ? 0 : errno;
#else
  return ::fsync(fd_) == 0 ? 0 : errno;
#endif
}

}  // namespace rotalog
