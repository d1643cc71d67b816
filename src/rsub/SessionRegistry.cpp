#include "SessionRegistry.hpp"

#include "Session.hpp"

namespace rsub {
bool SessionRegistry::insert(EditorHandle handle,
                             shared_ptr<Session> session) {
  lock_guard<std::mutex> guard(registryMutex);
  if (sessions.find(handle) != sessions.end()) {
    STERROR << "Tried to register editor handle " << handle << " twice";
    return false;
  }
  sessions.insert(std::make_pair(handle, session));
  VLOG(1) << "Registered session for handle " << handle << " ("
          << sessions.size() << " active)";
  return true;
}

shared_ptr<Session> SessionRegistry::lookup(EditorHandle handle) {
  lock_guard<std::mutex> guard(registryMutex);
  auto it = sessions.find(handle);
  if (it == sessions.end()) {
    return nullptr;
  }
  return it->second;
}

shared_ptr<Session> SessionRegistry::remove(EditorHandle handle) {
  lock_guard<std::mutex> guard(registryMutex);
  auto it = sessions.find(handle);
  if (it == sessions.end()) {
    return nullptr;
  }
  auto session = it->second;
  sessions.erase(it);
  VLOG(1) << "Removed session for handle " << handle << " (" << sessions.size()
          << " active)";
  return session;
}

size_t SessionRegistry::size() {
  lock_guard<std::mutex> guard(registryMutex);
  return sessions.size();
}

vector<EditorHandle> SessionRegistry::getHandles() {
  lock_guard<std::mutex> guard(registryMutex);
  vector<EditorHandle> handles;
  for (const auto& it : sessions) {
    handles.push_back(it.first);
  }
  return handles;
}
}  // namespace rsub
