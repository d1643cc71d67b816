#include "ConnectionHandler.hpp"

namespace rsub {
ConnectionHandler::ConnectionHandler(const SessionContext& _context,
                                     shared_ptr<EditorDispatcher> _dispatcher,
                                     int _clientFd,
                                     const std::atomic<bool>* _halt)
    : context(_context),
      dispatcher(_dispatcher),
      clientFd(_clientFd),
      halt(_halt),
      state(State::GREET) {}

string ConnectionHandler::greeting() {
  return string("rsubd ") + RSUB_VERSION + "\n";
}

void ConnectionHandler::run() {
  LOG(INFO) << "New connection on fd " << clientFd;
  try {
    string banner = greeting();
    context.socketHandler->writeAllOrThrow(clientFd, banner.data(),
                                           banner.length(), true);
    state = State::PARSING;

    LineReader reader(context.socketHandler, clientFd, halt);
    FrameParser parser;
    if (!readRequest(&reader, &parser)) {
      LOG(INFO) << "Connection on fd " << clientFd
                << " ended before a file was sent";
      state = State::FAILED;
    } else {
      OpenRequest request = parser.takeRequest();
      // Editor state may only be touched from the editor thread
      auto pendingSession = dispatcher->post([this, &request]() {
        return Session::materialize(context, clientFd, request);
      });
      if (awaitSession(&pendingSession)) {
        state = State::MATERIALIZED;
        drain(&reader);
      } else {
        state = State::FAILED;
      }
    }
  } catch (const ParseError& pe) {
    LOG(WARNING) << "Protocol error on fd " << clientFd << ": " << pe.what();
    state = State::FAILED;
  } catch (const std::exception& e) {
    LOG(WARNING) << "Error handling connection on fd " << clientFd << ": "
                 << e.what();
    state = State::FAILED;
  }
  teardown();
}

bool ConnectionHandler::readRequest(LineReader* reader, FrameParser* parser) {
  string input;
  while (!parser->isComplete()) {
    // Payload bytes are read raw so they are never split on newlines
    bool readingBody = parser->wantsBody();
    bool gotInput;
    try {
      gotInput = readingBody
                     ? reader->readUpTo(parser->bodyBytesRemaining(), &input)
                     : reader->readLine(&input);
    } catch (const LineTooLongError& ltle) {
      throw ParseError(ltle.what());
    }
    if (!gotInput) {
      return false;
    }
    if (readingBody) {
      parser->feedBody(input);
    } else {
      parser->feedLine(input);
    }
  }
  return true;
}

bool ConnectionHandler::awaitSession(
    std::future<shared_ptr<Session>>* pendingSession) {
  try {
    session = pendingSession->get();
    return true;
  } catch (const MaterializationError& me) {
    LOG(WARNING) << "Could not materialize file for fd " << clientFd << ": "
                 << me.what();
    return false;
  }
}

void ConnectionHandler::drain(LineReader* reader) {
  string line;
  try {
    while (reader->readLine(&line)) {
      string command = trim(line);
      if (command.empty() || command == ".") {
        continue;
      }
      if (command == "open") {
        LOG(WARNING) << "Ignoring a second open on fd " << clientFd;
      } else {
        VLOG(1) << "Ignoring input after open: " << command;
      }
    }
  } catch (const LineTooLongError& ltle) {
    LOG(WARNING) << "Dropping connection on fd " << clientFd << ": "
                 << ltle.what();
  }
}

void ConnectionHandler::teardown() {
  if (session) {
    session->detachConnection();
  }
  context.socketHandler->close(clientFd);

  if (session) {
    auto closingSession = session;
    try {
      dispatcher->post([closingSession]() { closingSession->terminate(); })
          .get();
    } catch (const std::runtime_error& re) {
      LOG(WARNING) << "Could not terminate " << session->getDisplayName()
                   << " on the editor thread: " << re.what();
    }
  }
  state = State::CLOSED;
  LOG(INFO) << "Connection on fd " << clientFd << " is done";
}
}  // namespace rsub
