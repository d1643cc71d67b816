#ifndef __RSUB_TCP_SOCKET_HANDLER__
#define __RSUB_TCP_SOCKET_HANDLER__

#include "UnixSocketHandler.hpp"

namespace rsub {
/**
 * @brief IPv4/IPv6 socket operations built on top of UnixSocketHandler.
 *
 * Listening sockets are bound to the addresses the endpoint's host name
 * resolves to (every interface when the name is empty).
 */
class TcpSocketHandler : public UnixSocketHandler {
 public:
  TcpSocketHandler();
  virtual ~TcpSocketHandler() {}

  /**
   * @brief Resolves the hostname/port and connects to the server.
   */
  virtual int connect(const SocketEndpoint& endpoint);
  /**
   * @brief Binds and listens on every address the endpoint resolves to.
   * @throws std::runtime_error when the address cannot be bound.
   */
  virtual set<int> listen(const SocketEndpoint& endpoint);
  /**
   * @brief Returns the listening socket fds associated with a port.
   */
  virtual set<int> getEndpointFds(const SocketEndpoint& endpoint);
  /**
   * @brief Stops listening on the requested port and closes all related fds.
   */
  virtual void stopListening(const SocketEndpoint& endpoint);

 protected:
  /** @brief Tracks all listening sockets created per TCP port. */
  map<int, set<int>> portServerSockets;

  /**
   * @brief Performs additional TCP-specific socket configuration (NODELAY).
   */
  virtual void initSocket(int fd);
};
}  // namespace rsub

#endif  // __RSUB_TCP_SOCKET_HANDLER__
