#ifndef __RSUB_EDITOR_HOST__
#define __RSUB_EDITOR_HOST__

#include "Headers.hpp"
#include "OpenRequest.hpp"

namespace rsub {
/** @brief Opaque identifier the editor assigns to an opened file. */
typedef int64_t EditorHandle;

enum class IndicatorKind {
  REMOTE_FILE,
};

class EditorEventRouter;

/**
 * @brief The host editor, as seen by sessions.
 *
 * Implementations are not thread-safe: every call must be made from the
 * editor's UI thread (see EditorDispatcher).  Events raised by the editor are
 * delivered to the router installed with setEventSink().
 */
class EditorHost {
 public:
  virtual ~EditorHost() {}

  /**
   * @brief Opens a file, jumping to `line` when one is given.
   * @return Handle used for every later call about this file.
   */
  virtual EditorHandle openFile(const string& path, optional<int> line) = 0;
  /** @brief Attaches the request headers to the opened file. */
  virtual void setArtifactMetadata(EditorHandle handle,
                                   const RequestVariables& variables) = 0;
  virtual void setVisualIndicator(EditorHandle handle, IndicatorKind kind) = 0;
  /** @brief Sets (or replaces) one keyed status entry for the file. */
  virtual void setStatus(EditorHandle handle, const string& key,
                         const string& text) = 0;
  /** @brief Marks the file's title to show its connection is gone. */
  virtual void setTitleBroken(EditorHandle handle) = 0;
  virtual bool isOpen(EditorHandle handle) = 0;
  virtual void bringHostWindowToFront() = 0;
  /** @brief Finds a syntax definition for a file extension. */
  virtual optional<string> lookupSyntaxForFileType(const string& fileType) = 0;
  virtual void setSyntax(EditorHandle handle, const string& syntax) = 0;
  /** @brief Surfaces an error to the user. */
  virtual void showError(const string& message) = 0;

  /** @brief Installs the receiver of onSaved/onClosed/onLoaded events. */
  virtual void setEventSink(shared_ptr<EditorEventRouter> router) = 0;
};
}  // namespace rsub

#endif  // __RSUB_EDITOR_HOST__
