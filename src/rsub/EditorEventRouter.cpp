#include "EditorEventRouter.hpp"

#include "Session.hpp"

namespace rsub {
EditorEventRouter::EditorEventRouter(shared_ptr<SessionRegistry> _registry)
    : registry(_registry) {}

bool EditorEventRouter::onSaved(EditorHandle handle) {
  auto session = registry->lookup(handle);
  if (!session) {
    VLOG(2) << "Save of handle " << handle << " has no session";
    return false;
  }
  return session->notifySaved();
}

bool EditorEventRouter::onClosed(EditorHandle handle) {
  auto session = registry->lookup(handle);
  if (!session) {
    VLOG(2) << "Close of handle " << handle << " has no session";
    return false;
  }
  session->notifyClosed();
  return true;
}

bool EditorEventRouter::onLoaded(EditorHandle handle) {
  auto session = registry->lookup(handle);
  if (!session) {
    return false;
  }
  return session->applyFileType();
}
}  // namespace rsub
