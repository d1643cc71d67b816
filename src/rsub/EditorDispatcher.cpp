#include "EditorDispatcher.hpp"

namespace rsub {
EditorDispatcher::EditorDispatcher() : uiThread(new ThreadPool(1)) {
  uiThread->enqueue([]() { el::Helpers::setThreadName("rsub-editor"); });
}

EditorDispatcher::~EditorDispatcher() { shutdown(); }

void EditorDispatcher::shutdown() {
  std::unique_ptr<ThreadPool> oldThread;
  {
    lock_guard<std::mutex> guard(dispatcherMutex);
    oldThread.swap(uiThread);
  }
  // Join outside the lock: a draining task that posts gets an exception
  // rather than a deadlock
  if (oldThread) {
    VLOG(1) << "Draining the editor dispatcher";
    oldThread.reset();
  }
}
}  // namespace rsub
