#ifndef __RSUB_SESSION_REGISTRY__
#define __RSUB_SESSION_REGISTRY__

#include "EditorHost.hpp"
#include "Headers.hpp"

namespace rsub {
class Session;

/**
 * @brief Thread-safe map from editor handle to the session that owns it.
 *
 * Written by the editor thread when a session is materialized, read and
 * emptied by editor callbacks and by teardown.  remove() hands a session to
 * exactly one caller, which is what makes teardown happen once.
 */
class SessionRegistry {
 public:
  SessionRegistry() {}

  /** @return false (and leaves the map alone) if the handle is taken. */
  bool insert(EditorHandle handle, shared_ptr<Session> session);

  /** @return The session for `handle`, or nullptr. */
  shared_ptr<Session> lookup(EditorHandle handle);

  /** @return The removed session, or nullptr if it was already gone. */
  shared_ptr<Session> remove(EditorHandle handle);

  size_t size();

  vector<EditorHandle> getHandles();

 protected:
  std::mutex registryMutex;
  std::unordered_map<EditorHandle, shared_ptr<Session>> sessions;
};
}  // namespace rsub

#endif  // __RSUB_SESSION_REGISTRY__
