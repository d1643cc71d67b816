#ifndef __RSUB_SESSION__
#define __RSUB_SESSION__

#include "EditorHost.hpp"
#include "Headers.hpp"
#include "OpenRequest.hpp"
#include "RsubErrors.hpp"
#include "SessionRegistry.hpp"
#include "SocketHandler.hpp"

namespace rsub {
/** @brief Collaborators shared by every session of one server. */
struct SessionContext {
  shared_ptr<SocketHandler> socketHandler;
  shared_ptr<EditorHost> editorHost;
  shared_ptr<SessionRegistry> registry;
  /** @brief Directory under which each session creates its own rsub-XXXXXX. */
  string tempRoot;
};

/**
 * @brief One remote file that is open in the local editor.
 *
 * A session owns its temp directory and the client socket it answers on.  It
 * ends exactly once, either through notifyClosed() (the user closed the file;
 * the client is told) or terminate() (the client went away first).  Whichever
 * call removes the session from the registry does the teardown; the other
 * becomes a no-op.
 *
 * materialize(), notifySaved(), notifyClosed() and terminate() run on the
 * editor thread.  detachConnection() is called by the connection thread.
 */
class Session : public std::enable_shared_from_this<Session> {
 public:
  /**
   * @brief Writes the payload to a fresh temp directory, opens it in the
   * editor and registers the session.
   * @throws MaterializationError if the temp directory or file cannot be
   * written, or the editor refuses the file.  Nothing is left on disk.
   */
  static shared_ptr<Session> materialize(const SessionContext& context,
                                         int socketFd,
                                         const OpenRequest& request);

  virtual ~Session();

  /**
   * @brief Streams the current on-disk content back to the client.
   * @return false if the file could not be read or the socket is broken.
   */
  bool notifySaved();

  /**
   * @brief Graceful close: tells the client, shuts the socket down and
   * removes the temp files.
   */
  void notifyClosed();

  /**
   * @brief Non-graceful close after the client disconnected: marks the
   * editor view broken and removes the temp files.  Nothing is sent.
   */
  void terminate();

  /**
   * @brief Applies the syntax matching the request's `file-type`, if the
   * editor knows one.
   * @return true when a syntax was applied.
   */
  bool applyFileType();

  /**
   * @brief Drops the session's reference to the socket.  Called by the
   * connection thread before it closes the fd, so no later notification can
   * write to a reused descriptor.
   */
  void detachConnection();

  bool hasConnection();

  string getDisplayName() const { return metadata.displayName(); }
  string getToken() const { return metadata.token(); }
  string getHostname() const { return metadata.hostname(); }
  optional<string> getFileType() const { return metadata.fileType(); }
  const string& getTempDirectory() const { return tempDirectory; }
  const string& getTempFilePath() const { return tempFilePath; }
  optional<EditorHandle> getEditorHandle() const { return editorHandle; }

 protected:
  Session(const SessionContext& _context, int _socketFd,
          const OpenRequest& request, const string& _tempDirectory,
          const string& _tempFilePath);

  /** @brief Writes to the client.  Caller holds connectionMutex. */
  bool send(const string& data);
  void removeTempFiles();

  SessionContext context;
  /** @brief The request's headers; the payload is not kept. */
  OpenRequest metadata;
  string tempDirectory;
  string tempFilePath;
  optional<EditorHandle> editorHandle;

  /** @brief Client socket, -1 once closed, detached or torn down. */
  int socketFd;
  bool connectionBroken;
  std::mutex connectionMutex;
};
}  // namespace rsub

#endif  // __RSUB_SESSION__
