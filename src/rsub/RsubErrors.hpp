#ifndef __RSUB_ERRORS__
#define __RSUB_ERRORS__

#include "Headers.hpp"

namespace rsub {
/**
 * @brief Malformed command or header on the wire.  The connection is aborted
 * without creating a session.
 */
class ParseError : public std::runtime_error {
 public:
  explicit ParseError(const string& what) : std::runtime_error(what) {}
};

/**
 * @brief The temp directory or temp file for a session could not be created.
 */
class MaterializationError : public std::runtime_error {
 public:
  explicit MaterializationError(const string& what)
      : std::runtime_error(what) {}
};
}  // namespace rsub

#endif  // __RSUB_ERRORS__
