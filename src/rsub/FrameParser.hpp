#ifndef __RSUB_FRAME_PARSER__
#define __RSUB_FRAME_PARSER__

#include "Headers.hpp"
#include "OpenRequest.hpp"
#include "RsubErrors.hpp"

namespace rsub {
/**
 * @brief Incremental parser for one connection's `open` transfer.
 *
 * Input arrives one line at a time (each line includes its '\n'), or, while
 * the body is being read, as raw chunks.  The wire format is:
 *
 *   open
 *   <name>: <value>
 *   ...
 *   data: <byte count>
 *   <exactly byte-count raw bytes>
 *   .
 *
 * Only one `open` is accepted per parser.  Malformed input throws ParseError.
 */
class FrameParser {
 public:
  enum class State {
    IDLE,
    AWAIT_OPEN,
    READING_HEADERS,
    READING_BODY,
    COMPLETE,
  };

  FrameParser();

  /**
   * @brief Consumes one line of input.
   *
   * While the body is incomplete the line is treated as raw payload bytes;
   * whatever is left after the declared size is matched against the `.`
   * terminator.
   * @throws ParseError on a malformed header, a bad `data` value, a missing
   * required header, or garbage where the terminator belongs.
   */
  void feedLine(const string& line);

  /**
   * @brief Appends raw payload bytes.
   * @return Number of bytes consumed; never more than bodyBytesRemaining().
   */
  size_t feedBody(const string& chunk);

  /** @brief True while the parser wants raw bytes rather than lines. */
  bool wantsBody() const {
    return state == State::READING_BODY && bodyBytesRemaining() > 0;
  }

  size_t bodyBytesRemaining() const {
    return declaredLength - request.payload.length();
  }

  bool isComplete() const { return state == State::COMPLETE; }

  State getState() const { return state; }

  /**
   * @brief Hands over the completed request.  May only be called once, after
   * isComplete() became true.
   */
  OpenRequest takeRequest();

 protected:
  void handleCommand(const string& command);
  void handleHeader(const string& line);
  void handleTerminator(const string& line);
  void finish();

  State state;
  OpenRequest request;
  size_t declaredLength;
  bool requestTaken;
};

ostream& operator<<(ostream& os, FrameParser::State state);
}  // namespace rsub

#endif  // __RSUB_FRAME_PARSER__
