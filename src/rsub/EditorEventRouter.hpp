#ifndef __RSUB_EDITOR_EVENT_ROUTER__
#define __RSUB_EDITOR_EVENT_ROUTER__

#include "EditorHost.hpp"
#include "Headers.hpp"
#include "SessionRegistry.hpp"

namespace rsub {
/**
 * @brief Turns editor events into session notifications.
 *
 * Each event looks the handle up in the registry and is dropped when no
 * session owns it (files the user opened locally, or sessions that already
 * ended).  Events are expected on the editor thread.
 */
class EditorEventRouter {
 public:
  explicit EditorEventRouter(shared_ptr<SessionRegistry> _registry);

  /** @return true if a session sent the new content to its client. */
  bool onSaved(EditorHandle handle);
  /** @return true if a session owned the handle and was closed. */
  bool onClosed(EditorHandle handle);
  /** @return true if a syntax was applied. */
  bool onLoaded(EditorHandle handle);

 protected:
  shared_ptr<SessionRegistry> registry;
};
}  // namespace rsub

#endif  // __RSUB_EDITOR_EVENT_ROUTER__
