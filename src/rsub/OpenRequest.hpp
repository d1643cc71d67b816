#ifndef __RSUB_OPEN_REQUEST__
#define __RSUB_OPEN_REQUEST__

#include "Headers.hpp"

namespace rsub {
/** @brief Protocol header name -> value. */
typedef map<string, string> RequestVariables;

/**
 * @brief A fully received `open` transfer: its headers and the raw file bytes.
 */
struct OpenRequest {
  RequestVariables variables;
  string payload;

  /** @brief Value of a header, or an empty string when it was not sent. */
  string get(const string& name) const;

  /** @brief The `display-name` header, formatted as `host:path`. */
  string displayName() const { return get("display-name"); }

  string token() const { return get("token"); }

  /** @brief Host part of the display name (text before the first ':'). */
  string hostname() const;

  /**
   * @brief File name used for the local copy: the last path segment of the
   * text after the last ':' in the display name.
   */
  string basename() const;

  /** @brief Requested cursor line, only when `selection` is all digits. */
  optional<int> selectionLine() const;

  /** @brief The `file-type` header when present and non-empty. */
  optional<string> fileType() const;
};
}  // namespace rsub

#endif  // __RSUB_OPEN_REQUEST__
