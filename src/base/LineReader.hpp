#ifndef __RSUB_LINE_READER__
#define __RSUB_LINE_READER__

#include "Headers.hpp"
#include "SocketHandler.hpp"

namespace rsub {
/** @brief Raised when a line grows past the reader's limit. */
class LineTooLongError : public std::runtime_error {
 public:
  explicit LineTooLongError(const string& what) : std::runtime_error(what) {}
};

/**
 * @brief Buffered reader that splits a socket's byte stream into lines or raw
 * chunks.
 *
 * Bytes are never decoded: a line is everything up to and including the next
 * '\n'.  Raw reads are served from the same buffer so a caller can switch
 * between line mode and binary mode at any byte boundary.
 */
class LineReader {
 public:
  LineReader(shared_ptr<SocketHandler> _socketHandler, int _fd,
             const std::atomic<bool>* _halt = nullptr,
             size_t _maxLineLength = MAX_LINE_LENGTH);

  /**
   * @brief Reads the next line, including its trailing newline.
   *
   * An unterminated final line is returned as-is when the peer closes.
   * Throws LineTooLongError once a line exceeds the length limit.
   * @return false once the stream has ended and nothing is buffered.
   */
  bool readLine(string* line);

  /**
   * @brief Reads between 1 and `count` raw bytes.
   * @return false once the stream has ended and nothing is buffered.
   */
  bool readUpTo(size_t count, string* out);

 protected:
  /** @brief Pulls more bytes from the socket into the buffer. */
  bool fill();

  shared_ptr<SocketHandler> socketHandler;
  int fd;
  const std::atomic<bool>* halt;
  size_t maxLineLength;
  string buffer;
  bool closed;
};
}  // namespace rsub

#endif  // __RSUB_LINE_READER__
