#ifndef __RSUB_EDITOR_DISPATCHER__
#define __RSUB_EDITOR_DISPATCHER__

#include "Headers.hpp"

namespace rsub {
/**
 * @brief Single-consumer task queue standing in for the editor's UI thread.
 *
 * Everything that touches the EditorHost or a Session's editor state is
 * posted here so those calls run one at a time, in posting order, on one
 * thread.  Destruction drains the queue before joining the worker.
 */
class EditorDispatcher {
 public:
  EditorDispatcher();
  ~EditorDispatcher();

  /**
   * @brief Queues a closure for the UI thread.
   * @return Future for the closure's result (or the exception it threw).
   * @throws std::runtime_error after shutdown().
   */
  template <class F>
  auto post(F&& f) -> std::future<typename std::result_of<F()>::type> {
    lock_guard<std::mutex> guard(dispatcherMutex);
    if (!uiThread) {
      throw std::runtime_error("Editor dispatcher has been shut down");
    }
    return uiThread->enqueue(std::forward<F>(f));
  }

  /** @brief Runs everything already queued, then stops the UI thread. */
  void shutdown();

 protected:
  std::unique_ptr<ThreadPool> uiThread;
  std::mutex dispatcherMutex;
};
}  // namespace rsub

#endif  // __RSUB_EDITOR_DISPATCHER__
