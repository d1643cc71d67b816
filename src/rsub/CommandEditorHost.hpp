#ifndef __RSUB_COMMAND_EDITOR_HOST__
#define __RSUB_COMMAND_EDITOR_HOST__

#include "EditorDispatcher.hpp"
#include "EditorEventRouter.hpp"
#include "EditorHost.hpp"
#include "Headers.hpp"

namespace rsub {
/**
 * @brief EditorHost that opens each file by launching an external editor
 * command.
 *
 * A watcher thread polls every opened file: a new modification time is
 * reported as a save, and, for editors that block until the file is closed
 * (`subl -w`, `code --wait`), the command exiting is reported as a close.
 * Events are posted to the dispatcher so they reach the router on the editor
 * thread.
 */
class CommandEditorHost : public EditorHost {
 public:
  CommandEditorHost(const string& _command, bool _gotoLine, bool _waits,
                    shared_ptr<EditorDispatcher> _dispatcher);
  virtual ~CommandEditorHost();

  virtual EditorHandle openFile(const string& path, optional<int> line);
  virtual void setArtifactMetadata(EditorHandle handle,
                                   const RequestVariables& variables);
  virtual void setVisualIndicator(EditorHandle handle, IndicatorKind kind);
  virtual void setStatus(EditorHandle handle, const string& key,
                         const string& text);
  virtual void setTitleBroken(EditorHandle handle);
  virtual bool isOpen(EditorHandle handle);
  virtual void bringHostWindowToFront();
  virtual optional<string> lookupSyntaxForFileType(const string& fileType);
  virtual void setSyntax(EditorHandle handle, const string& syntax);
  virtual void showError(const string& message);
  virtual void setEventSink(shared_ptr<EditorEventRouter> router);

  /** @brief Stops the watcher thread.  Safe to call more than once. */
  void stopWatching();

  /** @brief Arguments used to open `path`, with the command split on spaces. */
  vector<string> buildArguments(const string& path, optional<int> line) const;

 protected:
  struct OpenedFile {
    string path;
    string title;
    pid_t pid;
    fs::file_time_type lastWrite;
    map<string, string> status;
  };

  /** @brief fork/execvp the editor command. */
  pid_t launch(const vector<string>& args);
  void watchLoop();
  /**
   * @brief Checks one file for a save and for its editor exiting.
   * @return false once the file should no longer be watched.
   */
  bool pollFile(OpenedFile* file, bool* saved, bool* closed);
  void postEvent(EditorHandle handle, bool saved, bool closed, bool loaded);

  string command;
  bool gotoLine;
  bool waits;
  shared_ptr<EditorDispatcher> dispatcher;
  shared_ptr<EditorEventRouter> router;

  std::mutex filesMutex;
  map<EditorHandle, OpenedFile> files;
  EditorHandle nextHandle;

  std::atomic<bool> stopping;
  std::thread watcherThread;
};
}  // namespace rsub

#endif  // __RSUB_COMMAND_EDITOR_HOST__
