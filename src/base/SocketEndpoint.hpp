#ifndef __RSUB_SOCKET_ENDPOINT__
#define __RSUB_SOCKET_ENDPOINT__

#include "Headers.hpp"

namespace rsub {
/**
 * @brief Host/port pair that a listener binds to or a client connects to.
 */
class SocketEndpoint {
 public:
  SocketEndpoint() : name(""), port(-1) {}

  explicit SocketEndpoint(int _port) : name(""), port(_port) {}

  SocketEndpoint(const string &_name, int _port) : name(_name), port(_port) {}

  const string &getName() const { return name; }

  int getPort() const { return port; }

  bool hasName() const { return !name.empty(); }

 protected:
  string name;
  int port;
};

inline ostream &operator<<(ostream &os, const SocketEndpoint &self) {
  if (self.getPort() >= 0) {
    return os << self.getName() << ":" << self.getPort(), os;
  } else {
    return os << self.getName(), os;
  }
}
}  // namespace rsub

#endif  // __RSUB_SOCKET_ENDPOINT__
