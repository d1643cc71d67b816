#ifndef __RSUB_SERVER_CONFIG__
#define __RSUB_SERVER_CONFIG__

#include "Headers.hpp"

namespace rsub {
/**
 * @brief Startup settings of the daemon.
 *
 * Defaults are overridden by an INI file (loadConfigFile) and then by
 * command-line flags, which main applies last.
 */
struct ServerConfig {
  string host = DEFAULT_HOST;
  int port = DEFAULT_PORT;

  /** @brief Command used to open a file, split on spaces. */
  string editorCommand = "xdg-open";
  /** @brief Pass `path:line` instead of `path` when a line is requested. */
  bool gotoLine = false;
  /** @brief The editor command blocks until the file is closed. */
  bool editorWaits = false;

  /** @brief Where session directories go; empty means the system default. */
  string tempRoot;

  int verbose = 0;
  bool silent = false;
  string logDirectory;
  string maxLogSize = "20971520";

  /**
   * @brief Reads the [Networking], [Editor], [Storage] and [Debug] sections.
   * @throws std::runtime_error if the file cannot be parsed or holds an
   * invalid value.
   */
  void loadConfigFile(const string& path);

  /** @throws std::runtime_error describing the first invalid setting. */
  void validate() const;
};
}  // namespace rsub

#endif  // __RSUB_SERVER_CONFIG__
