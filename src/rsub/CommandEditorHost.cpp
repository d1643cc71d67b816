#include "CommandEditorHost.hpp"

namespace rsub {
namespace {
const int WATCH_INTERVAL_MS = 250;
}

CommandEditorHost::CommandEditorHost(const string& _command, bool _gotoLine,
                                     bool _waits,
                                     shared_ptr<EditorDispatcher> _dispatcher)
    : command(_command),
      gotoLine(_gotoLine),
      waits(_waits),
      dispatcher(_dispatcher),
      nextHandle(1),
      stopping(false) {
  watcherThread = std::thread(&CommandEditorHost::watchLoop, this);
}

CommandEditorHost::~CommandEditorHost() { stopWatching(); }

void CommandEditorHost::stopWatching() {
  stopping = true;
  if (watcherThread.joinable()) {
    watcherThread.join();
  }
}

vector<string> CommandEditorHost::buildArguments(const string& path,
                                                 optional<int> line) const {
  vector<string> args;
  for (const auto& token : split(command, ' ')) {
    if (!token.empty()) {
      args.push_back(token);
    }
  }
  if (gotoLine && line) {
    args.push_back(path + ":" + to_string(*line));
  } else {
    args.push_back(path);
  }
  return args;
}

pid_t CommandEditorHost::launch(const vector<string>& args) {
  // Build argv before forking: the child may only exec or exit
  vector<char*> argv;
  for (const auto& arg : args) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(NULL);

  pid_t pid = fork();
  if (pid == 0) {
    int devNull = ::open("/dev/null", O_RDONLY);
    if (devNull >= 0) {
      dup2(devNull, STDIN_FILENO);
      ::close(devNull);
    }
    execvp(argv[0], argv.data());
    _exit(127);
  }
  if (pid < 0) {
    throw std::runtime_error(string("Failed to fork editor: ") +
                             strerror(errno));
  }
  return pid;
}

EditorHandle CommandEditorHost::openFile(const string& path,
                                         optional<int> line) {
  vector<string> args = buildArguments(path, line);
  if (args.size() < 2) {
    throw std::runtime_error("Editor command is empty");
  }
  pid_t pid = launch(args);
  LOG(INFO) << "Opened " << path << " with " << args[0] << " (pid " << pid
            << ")";

  OpenedFile file;
  file.path = path;
  file.title = fs::path(path).filename().string();
  file.pid = pid;
  std::error_code ec;
  file.lastWrite = fs::last_write_time(path, ec);

  EditorHandle handle;
  {
    lock_guard<std::mutex> guard(filesMutex);
    handle = nextHandle++;
    files[handle] = file;
  }
  postEvent(handle, false, false, true);
  return handle;
}

void CommandEditorHost::setArtifactMetadata(EditorHandle handle,
                                            const RequestVariables& variables) {
  VLOG(1) << "Handle " << handle << " carries " << variables.size()
          << " variable(s)";
}

void CommandEditorHost::setVisualIndicator(EditorHandle handle,
                                           IndicatorKind kind) {
  if (kind == IndicatorKind::REMOTE_FILE) {
    VLOG(1) << "Handle " << handle << " is a remote file";
  }
}

void CommandEditorHost::setStatus(EditorHandle handle, const string& key,
                                  const string& text) {
  lock_guard<std::mutex> guard(filesMutex);
  auto it = files.find(handle);
  if (it == files.end()) {
    return;
  }
  it->second.status[key] = text;
  LOG(INFO) << it->second.title << ": " << text;
}

void CommandEditorHost::setTitleBroken(EditorHandle handle) {
  lock_guard<std::mutex> guard(filesMutex);
  auto it = files.find(handle);
  if (it == files.end()) {
    return;
  }
  // U+2757 heavy exclamation mark
  it->second.title = "\xE2\x9D\x97" + it->second.title;
  LOG(WARNING) << it->second.title << ": saves will no longer reach the client";
}

bool CommandEditorHost::isOpen(EditorHandle handle) {
  lock_guard<std::mutex> guard(filesMutex);
  return files.find(handle) != files.end();
}

void CommandEditorHost::bringHostWindowToFront() {
  VLOG(1) << "The editor command owns its window";
}

optional<string> CommandEditorHost::lookupSyntaxForFileType(
    const string& fileType) {
  VLOG(1) << "No syntax table for file type " << fileType;
  return nullopt;
}

void CommandEditorHost::setSyntax(EditorHandle handle, const string& syntax) {
  VLOG(1) << "Handle " << handle << " syntax " << syntax;
}

void CommandEditorHost::showError(const string& message) {
  LOG(ERROR) << message;
  CLOG(INFO, "stdout") << "Error: " << message << endl;
}

void CommandEditorHost::setEventSink(shared_ptr<EditorEventRouter> _router) {
  lock_guard<std::mutex> guard(filesMutex);
  router = _router;
}

bool CommandEditorHost::pollFile(OpenedFile* file, bool* saved, bool* closed) {
  *saved = false;
  *closed = false;
  std::error_code ec;
  auto lastWrite = fs::last_write_time(file->path, ec);
  if (ec) {
    // The session removed its temp file: nothing left to watch
    VLOG(1) << "Stopped watching " << file->path;
    return false;
  }
  if (lastWrite != file->lastWrite) {
    file->lastWrite = lastWrite;
    *saved = true;
  }

  if (file->pid > 0) {
    int status;
    pid_t rc = waitpid(file->pid, &status, WNOHANG);
    if (rc == file->pid || (rc < 0 && errno == ECHILD)) {
      file->pid = -1;
      if (waits) {
        *closed = true;
        return false;
      }
    }
  }
  return true;
}

void CommandEditorHost::watchLoop() {
  el::Helpers::setThreadName("rsub-watcher");
  while (!stopping) {
    vector<tuple<EditorHandle, bool, bool>> events;
    {
      lock_guard<std::mutex> guard(filesMutex);
      auto it = files.begin();
      while (it != files.end()) {
        bool saved, closed;
        bool keep = pollFile(&it->second, &saved, &closed);
        if (saved || closed) {
          events.push_back(make_tuple(it->first, saved, closed));
        }
        if (keep) {
          ++it;
        } else {
          it = files.erase(it);
        }
      }
    }
    for (const auto& event : events) {
      postEvent(get<0>(event), get<1>(event), get<2>(event), false);
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(WATCH_INTERVAL_MS));
  }
}

void CommandEditorHost::postEvent(EditorHandle handle, bool saved, bool closed,
                                  bool loaded) {
  shared_ptr<EditorEventRouter> currentRouter;
  {
    lock_guard<std::mutex> guard(filesMutex);
    currentRouter = router;
  }
  if (!currentRouter) {
    return;
  }
  try {
    // Saves go first so a close never drops the last write
    dispatcher->post([currentRouter, handle, saved, closed, loaded]() {
      if (loaded) {
        currentRouter->onLoaded(handle);
      }
      if (saved) {
        currentRouter->onSaved(handle);
      }
      if (closed) {
        currentRouter->onClosed(handle);
      }
    });
  } catch (const std::runtime_error& re) {
    LOG(WARNING) << "Dropping editor event for handle " << handle << ": "
                 << re.what();
  }
}
}  // namespace rsub
