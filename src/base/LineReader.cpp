#include "LineReader.hpp"

#define READ_CHUNK_SIZE (16 * 1024)

namespace rsub {
LineReader::LineReader(shared_ptr<SocketHandler> _socketHandler, int _fd,
                       const std::atomic<bool>* _halt,
                       size_t _maxLineLength)
    : socketHandler(_socketHandler),
      fd(_fd),
      halt(_halt),
      maxLineLength(_maxLineLength),
      closed(false) {}

bool LineReader::readLine(string* line) {
  while (true) {
    auto newlinePos = buffer.find('\n');
    if ((newlinePos == string::npos && buffer.length() > maxLineLength) ||
        (newlinePos != string::npos && newlinePos + 1 > maxLineLength)) {
      throw LineTooLongError("Line on fd " + std::to_string(fd) +
                             " is longer than " +
                             std::to_string(maxLineLength) + " bytes");
    }
    if (newlinePos != string::npos) {
      *line = buffer.substr(0, newlinePos + 1);
      buffer.erase(0, newlinePos + 1);
      return true;
    }
    if (!fill()) {
      if (buffer.empty()) {
        return false;
      }
      *line = buffer;
      buffer.clear();
      return true;
    }
  }
}

bool LineReader::readUpTo(size_t count, string* out) {
  if (count == 0) {
    out->clear();
    return true;
  }
  if (buffer.empty() && !fill()) {
    return false;
  }
  size_t n = min(count, buffer.length());
  *out = buffer.substr(0, n);
  buffer.erase(0, n);
  return true;
}

bool LineReader::fill() {
  if (closed) {
    return false;
  }
  char buf[READ_CHUNK_SIZE];
  while (true) {
    if (halt && halt->load()) {
      VLOG(1) << "Halt requested while reading from fd " << fd;
      closed = true;
      return false;
    }
    // Wake up every second so a halt request is noticed
    if (!socketHandler->waitForData(fd, 1, 0)) {
      continue;
    }
    ssize_t bytesRead = socketHandler->read(fd, buf, READ_CHUNK_SIZE);
    if (bytesRead > 0) {
      buffer.append(buf, bytesRead);
      return true;
    }
    if (bytesRead == 0) {
      VLOG(1) << "End of stream on fd " << fd;
      closed = true;
      return false;
    }
    auto localErrno = errno;
    if (localErrno == EAGAIN || localErrno == EWOULDBLOCK ||
        localErrno == EINTR) {
      continue;
    }
    // Errors mid-read are treated like end-of-stream
    VLOG(1) << "Read error on fd " << fd << ": " << strerror(localErrno);
    closed = true;
    return false;
  }
}
}  // namespace rsub
