#ifndef __RSUB_FAKE_EDITOR_HOST__
#define __RSUB_FAKE_EDITOR_HOST__

#include "EditorEventRouter.hpp"
#include "EditorHost.hpp"

namespace rsub {
/**
 * @brief In-memory EditorHost that records every call.
 *
 * Tests read the recorded state after synchronizing with the editor thread
 * (a dispatcher future) or after the connection thread finished.
 */
class FakeEditorHost : public EditorHost {
 public:
  FakeEditorHost() : nextHandle(1), frontCount(0), failOpen(false) {}

  virtual EditorHandle openFile(const string& path, optional<int> line) {
    lock_guard<std::recursive_mutex> guard(fakeMutex);
    if (failOpen) {
      throw std::runtime_error("editor refused " + path);
    }
    EditorHandle handle = forcedHandle ? *forcedHandle : nextHandle++;
    openedPaths[handle] = path;
    openedLines[handle] = line;
    openHandles.insert(handle);
    return handle;
  }

  virtual void setArtifactMetadata(EditorHandle handle,
                                   const RequestVariables& variables) {
    lock_guard<std::recursive_mutex> guard(fakeMutex);
    metadata[handle] = variables;
  }

  virtual void setVisualIndicator(EditorHandle handle, IndicatorKind kind) {
    lock_guard<std::recursive_mutex> guard(fakeMutex);
    indicators[handle] = kind;
  }

  virtual void setStatus(EditorHandle handle, const string& key,
                         const string& text) {
    lock_guard<std::recursive_mutex> guard(fakeMutex);
    statuses[handle][key] = text;
  }

  virtual void setTitleBroken(EditorHandle handle) {
    lock_guard<std::recursive_mutex> guard(fakeMutex);
    brokenTitles.insert(handle);
  }

  virtual bool isOpen(EditorHandle handle) {
    lock_guard<std::recursive_mutex> guard(fakeMutex);
    return openHandles.find(handle) != openHandles.end();
  }

  virtual void bringHostWindowToFront() {
    lock_guard<std::recursive_mutex> guard(fakeMutex);
    frontCount++;
  }

  virtual optional<string> lookupSyntaxForFileType(const string& fileType) {
    lock_guard<std::recursive_mutex> guard(fakeMutex);
    auto it = knownSyntaxes.find(fileType);
    if (it == knownSyntaxes.end()) {
      return nullopt;
    }
    return it->second;
  }

  virtual void setSyntax(EditorHandle handle, const string& syntax) {
    lock_guard<std::recursive_mutex> guard(fakeMutex);
    appliedSyntaxes[handle] = syntax;
  }

  virtual void showError(const string& message) {
    lock_guard<std::recursive_mutex> guard(fakeMutex);
    errors.push_back(message);
  }

  virtual void setEventSink(shared_ptr<EditorEventRouter> _router) {
    lock_guard<std::recursive_mutex> guard(fakeMutex);
    router = _router;
  }

  /** @brief The user closed the file: it is no longer open. */
  void closeFile(EditorHandle handle) {
    lock_guard<std::recursive_mutex> guard(fakeMutex);
    openHandles.erase(handle);
  }

  string getStatus(EditorHandle handle, const string& key) {
    lock_guard<std::recursive_mutex> guard(fakeMutex);
    return statuses[handle][key];
  }

  size_t getErrorCount() {
    lock_guard<std::recursive_mutex> guard(fakeMutex);
    return errors.size();
  }

  std::recursive_mutex fakeMutex;
  EditorHandle nextHandle;
  optional<EditorHandle> forcedHandle;
  map<EditorHandle, string> openedPaths;
  map<EditorHandle, optional<int>> openedLines;
  set<EditorHandle> openHandles;
  map<EditorHandle, RequestVariables> metadata;
  map<EditorHandle, IndicatorKind> indicators;
  map<EditorHandle, map<string, string>> statuses;
  set<EditorHandle> brokenTitles;
  map<string, string> knownSyntaxes;
  map<EditorHandle, string> appliedSyntaxes;
  vector<string> errors;
  int frontCount;
  bool failOpen;
  shared_ptr<EditorEventRouter> router;
};
}  // namespace rsub

#endif  // __RSUB_FAKE_EDITOR_HOST__
