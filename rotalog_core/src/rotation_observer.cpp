#include "rotalog/rotation_observer.hpp"

namespace rotalog
{

CallbackRotationObserver::CallbackRotationObserver(ArchivedCallback on_archived,
                                                   RemovedCallback on_removed)
    : on_archived_(std::move(on_archived)), on_removed_(std::move(on_removed))
{
}

void CallbackRotationObserver::OnArchived(const std::string& target_path,
                                          const std::string& archive_path)
{
  if (on_archived_)
  {
    on_archived_(target_path, archive_path);
  }
}

void CallbackRotationObserver::OnArchiveRemoved(const std::string& archive_path)
{
  if (on_removed_)
  {
    on_removed_(archive_path);
  }
}

}  // namespace rotalog
