#include "TcpSocketHandler.hpp"

namespace rsub {
TcpSocketHandler::TcpSocketHandler() {}

int TcpSocketHandler::connect(const SocketEndpoint &endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);
  int sockFd = -1;
  addrinfo *results = NULL;
  addrinfo *p = NULL;
  addrinfo hints;
  memset(&hints, 0, sizeof(addrinfo));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  std::string portname = std::to_string(endpoint.getPort());
  std::string hostname = endpoint.getName();

  int rc = getaddrinfo(hostname.c_str(), portname.c_str(), &hints, &results);
  if (rc != 0) {
    LOG(ERROR) << "Error getting address info for " << endpoint << ": " << rc
               << " (" << gai_strerror(rc) << ")";
    if (results) {
      freeaddrinfo(results);
    }
    return -1;
  }

  // loop through all the results and connect to the first we can
  for (p = results; p != NULL; p = p->ai_next) {
    if ((sockFd = socket(p->ai_family, p->ai_socktype, p->ai_protocol)) == -1) {
      LOG(INFO) << "Error creating socket: " << errno << " " << strerror(errno);
      continue;
    }
    if (::connect(sockFd, p->ai_addr, p->ai_addrlen) == -1) {
      LOG(INFO) << "Error connecting to " << endpoint << ": " << errno << " "
                << strerror(errno);
      ::close(sockFd);
      sockFd = -1;
      continue;
    }
    LOG(INFO) << "Connected to " << endpoint << " using fd " << sockFd;
    break;
  }
  freeaddrinfo(results);

  if (sockFd == -1) {
    LOG(ERROR) << "Could not connect to " << endpoint;
    return -1;
  }
  addToActiveSockets(sockFd);
  initSocket(sockFd);
  return sockFd;
}

set<int> TcpSocketHandler::listen(const SocketEndpoint &endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);

  int port = endpoint.getPort();
  if (portServerSockets.find(port) != portServerSockets.end()) {
    STFATAL << "Tried to listen twice on the same port";
  }

  addrinfo hints, *servinfo, *p;
  int rc;

  memset(&hints, 0, sizeof hints);
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = AI_PASSIVE;

  std::string portname = std::to_string(port);
  const char *hostname =
      endpoint.hasName() ? endpoint.getName().c_str() : NULL;

  if ((rc = getaddrinfo(hostname, portname.c_str(), &hints, &servinfo)) != 0) {
    stringstream oss;
    oss << "Error getting address info for " << endpoint << ": " << rc << " ("
        << gai_strerror(rc) << ")";
    LOG(ERROR) << oss.str();
    throw std::runtime_error(oss.str());
  }

  set<int> serverSockets;
  for (p = servinfo; p != NULL; p = p->ai_next) {
    int sockFd;
    if ((sockFd = socket(p->ai_family, p->ai_socktype, p->ai_protocol)) == -1) {
      LOG(INFO) << "Error creating socket " << p->ai_family << "/"
                << p->ai_socktype << "/" << p->ai_protocol << ": " << errno
                << " " << strerror(errno);
      continue;
    }
    initServerSocket(sockFd);

    if (p->ai_family == AF_INET6) {
      // IPV6 sockets only listen on IPV6 interfaces.  The IPV4 address (if
      // any) gets its own socket.
      int flag = 1;
      FATAL_FAIL(setsockopt(sockFd, IPPROTO_IPV6, IPV6_V6ONLY, (char *)&flag,
                            sizeof(int)));
    }

    if (::bind(sockFd, p->ai_addr, p->ai_addrlen) == -1) {
      // This most often happens because the port is in use.
      stringstream oss;
      oss << "Error binding " << endpoint << " (" << p->ai_family << "/"
          << p->ai_socktype << "/" << p->ai_protocol << "): " << errno << " "
          << strerror(errno);
      string s = oss.str();
      LOG(ERROR) << s;
      ::close(sockFd);
      for (int fd : serverSockets) {
        close(fd);
      }
      freeaddrinfo(servinfo);
      throw std::runtime_error(s.c_str());
    }

    FATAL_FAIL(::listen(sockFd, 32));
    char addressString[INET6_ADDRSTRLEN] = {0};
    if (p->ai_family == AF_INET6) {
      inet_ntop(AF_INET6, &((sockaddr_in6 *)p->ai_addr)->sin6_addr,
                addressString, sizeof(addressString));
    } else {
      inet_ntop(AF_INET, &((sockaddr_in *)p->ai_addr)->sin_addr,
                addressString, sizeof(addressString));
    }
    LOG(INFO) << "Listening on " << addressString << ":" << port << "/"
              << p->ai_family << "/" << p->ai_socktype << "/"
              << p->ai_protocol;

    addToActiveSockets(sockFd);
    serverSockets.insert(sockFd);
  }
  freeaddrinfo(servinfo);

  if (serverSockets.empty()) {
    stringstream oss;
    oss << "Could not bind to any interface for " << endpoint;
    throw std::runtime_error(oss.str());
  }

  portServerSockets[port] = serverSockets;
  return serverSockets;
}

set<int> TcpSocketHandler::getEndpointFds(const SocketEndpoint &endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);

  int port = endpoint.getPort();
  if (portServerSockets.find(port) == portServerSockets.end()) {
    STFATAL
        << "Tried to getEndpointFds on a port without calling listen() first";
  }
  return portServerSockets[port];
}

void TcpSocketHandler::stopListening(const SocketEndpoint &endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);

  int port = endpoint.getPort();
  auto it = portServerSockets.find(port);
  if (it == portServerSockets.end()) {
    LOG(WARNING)
        << "Tried to stop listening to a port that we weren't listening on";
    return;
  }
  for (int sockFd : it->second) {
    close(sockFd);
  }
  portServerSockets.erase(it);
}

void TcpSocketHandler::initSocket(int fd) {
  UnixSocketHandler::initSocket(fd);
  int flag = 1;
  FATAL_FAIL_UNLESS_EINVAL(
      setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, (char *)&flag, sizeof(int)));
}
}  // namespace rsub
