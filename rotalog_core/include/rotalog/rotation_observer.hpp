#pragma once
#include <functional>
#include <string>

namespace rotalog
{

// Receives rotation events. Called on the logger's serial context, so
// implementations must not call back into the logger synchronously.
class IRotationObserver
{
 public:
  virtual ~IRotationObserver() = default;

  virtual void OnArchived(const std::string& target_path, const std::string& archive_path) = 0;
  virtual void OnArchiveRemoved(const std::string& archive_path) = 0;
};

class CallbackRotationObserver : public IRotationObserver
{
 public:
  using ArchivedCallback = std::function<void(const std::string&, const std::string&)>;
  using RemovedCallback = std::function<void(const std::string&)>;

  CallbackRotationObserver(ArchivedCallback on_archived, RemovedCallback on_removed);

  void OnArchived(const std::string& target_path, const std::string& archive_path) override;
  void OnArchiveRemoved(const std::string& archive_path) override;

 private:
  ArchivedCallback on_archived_;
  RemovedCallback on_removed_;
};

}  // namespace rotalog
