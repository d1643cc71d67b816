#include "FrameParser.hpp"

namespace rsub {
FrameParser::FrameParser()
    : state(State::IDLE), declaredLength(0), requestTaken(false) {}

void FrameParser::feedLine(const string& line) {
  switch (state) {
    case State::IDLE:
      state = State::AWAIT_OPEN;
      handleCommand(line);
      break;
    case State::AWAIT_OPEN:
      handleCommand(line);
      break;
    case State::READING_HEADERS:
      handleHeader(line);
      break;
    case State::READING_BODY: {
      // Payload lines are binary: take bytes up to the declared size verbatim
      size_t consumed = feedBody(line);
      if (consumed < line.length()) {
        handleTerminator(line.substr(consumed));
      }
      break;
    }
    case State::COMPLETE:
      VLOG(2) << "Ignoring input after the transfer completed";
      break;
  }
}

size_t FrameParser::feedBody(const string& chunk) {
  if (state != State::READING_BODY) {
    STFATAL << "Tried to feed body bytes in state " << state;
  }
  size_t n = min(chunk.length(), bodyBytesRemaining());
  request.payload.append(chunk, 0, n);
  VLOG(3) << "Payload " << request.payload.length() << "/" << declaredLength;
  return n;
}

OpenRequest FrameParser::takeRequest() {
  if (state != State::COMPLETE) {
    STFATAL << "Tried to take a request before it was complete: " << state;
  }
  if (requestTaken) {
    STFATAL << "Tried to take the same request twice";
  }
  requestTaken = true;
  return std::move(request);
}

void FrameParser::handleCommand(const string& line) {
  string command = trim(line);
  if (command.empty()) {
    return;
  }
  if (command == "open") {
    VLOG(1) << "Got open command";
    state = State::READING_HEADERS;
  } else if (command == ".") {
    // rmate ends its command list with a lone '.'
    VLOG(2) << "Ignoring end-of-commands marker";
  } else {
    LOG(INFO) << "Unknown command: " << command;
  }
}

void FrameParser::handleHeader(const string& line) {
  string header = trim(line);
  if (header.empty()) {
    return;
  }
  auto colonPos = header.find(':');
  if (colonPos == string::npos) {
    throw ParseError("Malformed header line: " + header);
  }
  string name = trim(header.substr(0, colonPos));
  string value = trim(header.substr(colonPos + 1));
  VLOG(1) << "Header " << name << ": " << value;

  if (name != "data") {
    request.variables[name] = value;
    return;
  }

  if (!isAllDigits(value) || value.length() > 10) {
    throw ParseError("Invalid data length: " + value);
  }
  int64_t length = stoll(value);
  if (length > MAX_PAYLOAD_SIZE) {
    throw ParseError("Invalid size (>128 MB): " + value);
  }
  if (request.variables.empty()) {
    // A data header must follow at least one other header
    LOG(WARNING) << "Ignoring data header that arrived before any other header";
    return;
  }
  declaredLength = size_t(length);
  request.payload.reserve(declaredLength);
  state = State::READING_BODY;
}

void FrameParser::handleTerminator(const string& line) {
  string terminator = trim(line);
  if (terminator == ".") {
    finish();
    return;
  }
  if (terminator.empty()) {
    // rmate sends a newline between the payload and the terminator
    return;
  }
  if (terminator == "open") {
    // rmate only sends '.' after the last file of a multi-file send
    LOG(WARNING) << "Only one file per connection, ignoring the files after "
                 << request.displayName();
    finish();
    return;
  }
  throw ParseError("Expected '.' after " + std::to_string(declaredLength) +
                   " bytes of payload, got: " + terminator);
}

void FrameParser::finish() {
  if (request.variables.find("display-name") == request.variables.end()) {
    throw ParseError("Missing display-name header");
  }
  if (request.variables.find("token") == request.variables.end()) {
    throw ParseError("Missing token header");
  }
  LOG(INFO) << "Received " << request.payload.length() << " bytes for "
            << request.displayName();
  state = State::COMPLETE;
}

ostream& operator<<(ostream& os, FrameParser::State state) {
  switch (state) {
    case FrameParser::State::IDLE:
      return os << "IDLE";
    case FrameParser::State::AWAIT_OPEN:
      return os << "AWAIT_OPEN";
    case FrameParser::State::READING_HEADERS:
      return os << "READING_HEADERS";
    case FrameParser::State::READING_BODY:
      return os << "READING_BODY";
    case FrameParser::State::COMPLETE:
      return os << "COMPLETE";
  }
  return os << "UNKNOWN";
}
}  // namespace rsub
