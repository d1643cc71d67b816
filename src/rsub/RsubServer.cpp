#include "RsubServer.hpp"

namespace rsub {
RsubServer::RsubServer(std::shared_ptr<SocketHandler> _socketHandler,
                       const SocketEndpoint& _serverEndpoint,
                       std::shared_ptr<EditorHost> _editorHost,
                       std::shared_ptr<EditorDispatcher> _dispatcher,
                       std::shared_ptr<SessionRegistry> _registry,
                       const string& _tempRoot)
    : serverEndpoint(_serverEndpoint),
      dispatcher(_dispatcher),
      halt(false),
      listening(false) {
  context.socketHandler = _socketHandler;
  context.editorHost = _editorHost;
  context.registry = _registry;
  context.tempRoot = _tempRoot;
  context.socketHandler->listen(serverEndpoint);
  listening = true;
}

RsubServer::~RsubServer() {
  shutdown();
  joinAllHandlers();
  if (listening) {
    context.socketHandler->stopListening(serverEndpoint);
  }
}

void RsubServer::run() {
  LOG(INFO) << "Server running on " << serverEndpoint;
  fd_set coreFds;
  int maxCoreFd = 0;
  FD_ZERO(&coreFds);
  set<int> serverPortFds =
      context.socketHandler->getEndpointFds(serverEndpoint);
  for (int i : serverPortFds) {
    FD_SET(i, &coreFds);
    maxCoreFd = max(maxCoreFd, i);
  }

  while (!halt) {
    // Select blocks until there is something useful to do
    fd_set rfds = coreFds;
    timeval tv;
    tv.tv_sec = 0;
    tv.tv_usec = 100 * 1000;
    int numFdsSet = select(maxCoreFd + 1, &rfds, NULL, NULL, &tv);
    if (numFdsSet == -1 && errno == EINTR) {
      continue;
    }
    FATAL_FAIL(numFdsSet);
    if (numFdsSet > 0) {
      for (int i : serverPortFds) {
        if (FD_ISSET(i, &rfds)) {
          acceptNewConnection(i);
        }
      }
    }
    reapFinishedHandlers();
  }

  LOG(INFO) << "Shutting down: waiting for " << getActiveHandlerCount()
            << " connection(s)";
  joinAllHandlers();
  context.socketHandler->stopListening(serverEndpoint);
  listening = false;
  LOG(INFO) << "Server on " << serverEndpoint << " stopped";
}

bool RsubServer::acceptNewConnection(int fd) {
  VLOG(1) << "Accepting connection";
  int clientSocketFd = context.socketHandler->accept(fd);
  if (clientSocketFd < 0) {
    return false;
  }
  VLOG(1) << "SERVER: got client socket fd: " << clientSocketFd;
  auto done = make_shared<std::atomic<bool>>(false);
  auto handlerThread =
      make_shared<thread>([this, clientSocketFd, done]() {
        el::Helpers::setThreadName("rsub-connection");
        ConnectionHandler handler(context, dispatcher, clientSocketFd, &halt);
        handler.run();
        *done = true;
      });
  lock_guard<std::mutex> guard(handlerThreadMutex);
  handlerThreads.push_back({handlerThread, done});
  return true;
}

size_t RsubServer::getActiveHandlerCount() {
  lock_guard<std::mutex> guard(handlerThreadMutex);
  return std::count_if(
      handlerThreads.begin(), handlerThreads.end(),
      [](const HandlerThread& ht) { return !ht.done->load(); });
}

void RsubServer::reapFinishedHandlers() {
  lock_guard<std::mutex> guard(handlerThreadMutex);
  auto it = handlerThreads.begin();
  while (it != handlerThreads.end()) {
    if (it->done->load()) {
      it->handlerThread->join();
      it = handlerThreads.erase(it);
    } else {
      ++it;
    }
  }
}

void RsubServer::joinAllHandlers() {
  vector<HandlerThread> threadsToJoin;
  {
    lock_guard<std::mutex> guard(handlerThreadMutex);
    threadsToJoin.swap(handlerThreads);
  }
  for (auto& it : threadsToJoin) {
    it.handlerThread->join();
  }
}
}  // namespace rsub
