#ifndef __RSUB_RSUB_SERVER__
#define __RSUB_RSUB_SERVER__

#include "ConnectionHandler.hpp"
#include "EditorDispatcher.hpp"
#include "EditorHost.hpp"
#include "Headers.hpp"
#include "SessionRegistry.hpp"
#include "SocketHandler.hpp"

namespace rsub {
/**
 * @brief Accepts rmate clients and runs one ConnectionHandler thread per
 * connection.
 *
 * The listening socket is bound in the constructor.  run() blocks until
 * shutdown() is called (from any thread or a signal handler), then joins
 * every handler and releases the listening socket.
 */
class RsubServer {
 public:
  /**
   * @throws std::runtime_error when the endpoint cannot be bound.
   */
  RsubServer(std::shared_ptr<SocketHandler> _socketHandler,
             const SocketEndpoint& _serverEndpoint,
             std::shared_ptr<EditorHost> _editorHost,
             std::shared_ptr<EditorDispatcher> _dispatcher,
             std::shared_ptr<SessionRegistry> _registry,
             const string& _tempRoot);
  virtual ~RsubServer();

  /** @brief Main loop that accepts client connections. */
  void run();

  /** @brief Signals the accept loop and every handler to stop. */
  void shutdown() { halt = true; }

  bool isHalted() const { return halt; }

  /**
   * @brief Accepts a pending connection on a listening fd and starts its
   * handler thread.
   */
  bool acceptNewConnection(int fd);

  /** @brief Number of handler threads that have not finished yet. */
  size_t getActiveHandlerCount();

  shared_ptr<SessionRegistry> getRegistry() { return context.registry; }

 protected:
  struct HandlerThread {
    shared_ptr<thread> handlerThread;
    shared_ptr<std::atomic<bool>> done;
  };

  /** @brief Joins handler threads that already returned. */
  void reapFinishedHandlers();
  void joinAllHandlers();

  SocketEndpoint serverEndpoint;
  SessionContext context;
  shared_ptr<EditorDispatcher> dispatcher;
  /** @brief Set by shutdown(); polled by the accept loop and the handlers. */
  std::atomic<bool> halt;
  bool listening;
  vector<HandlerThread> handlerThreads;
  /** @brief Guards access to `handlerThreads`. */
  mutex handlerThreadMutex;
};
}  // namespace rsub

#endif  // __RSUB_RSUB_SERVER__
