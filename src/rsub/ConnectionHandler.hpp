#ifndef __RSUB_CONNECTION_HANDLER__
#define __RSUB_CONNECTION_HANDLER__

#include "EditorDispatcher.hpp"
#include "FrameParser.hpp"
#include "Headers.hpp"
#include "LineReader.hpp"
#include "Session.hpp"

namespace rsub {
/**
 * @brief Drives one accepted client socket from greeting to teardown.
 *
 * run() blocks the calling thread: it greets the client, feeds the stream to
 * a FrameParser, hands a completed request to the editor thread for
 * materialization, then keeps reading until the client goes away so the
 * session can be terminated.  It never throws.
 */
class ConnectionHandler {
 public:
  enum class State {
    GREET,
    PARSING,
    MATERIALIZED,
    FAILED,
    CLOSED,
  };

  ConnectionHandler(const SessionContext& _context,
                    shared_ptr<EditorDispatcher> _dispatcher, int _clientFd,
                    const std::atomic<bool>* _halt = nullptr);

  /** @brief Runs the connection to completion and closes the socket. */
  void run();

  State getState() const { return state; }

  /** @brief The materialized session, if any. */
  shared_ptr<Session> getSession() const { return session; }

  static string greeting();

 protected:
  /** @brief Reads and parses until the transfer completes or input ends. */
  bool readRequest(LineReader* reader, FrameParser* parser);
  /** @brief Waits for the editor thread to materialize the request. */
  bool awaitSession(std::future<shared_ptr<Session>>* pendingSession);
  /** @brief Discards input until the client closes or the server halts. */
  void drain(LineReader* reader);
  void teardown();

  SessionContext context;
  shared_ptr<EditorDispatcher> dispatcher;
  int clientFd;
  const std::atomic<bool>* halt;
  State state;
  shared_ptr<Session> session;
};
}  // namespace rsub

#endif  // __RSUB_CONNECTION_HANDLER__
