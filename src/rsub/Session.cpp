#include "Session.hpp"

namespace rsub {
namespace {
string createTempDirectory(const string& tempRoot) {
  string pattern = tempRoot;
  if (pattern.empty()) {
    pattern = GetTempDirectory();
  }
  if (pattern.back() != '/') {
    pattern += "/";
  }
  pattern += "rsub-XXXXXX";
  // mkdtemp picks an unpredictable name and creates it with mode 0700
  if (::mkdtemp(&pattern[0]) == NULL) {
    auto localErrno = errno;
    throw MaterializationError("Failed to create rsub temporary directory in " +
                               tempRoot + ": " + strerror(localErrno));
  }
  return pattern;
}

void writeFile(const string& path, const string& data) {
  std::ofstream out(path, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!out.is_open()) {
    throw MaterializationError("Failed to write file: " + path);
  }
  out.write(data.data(), data.length());
  out.close();
  if (out.fail()) {
    throw MaterializationError("Failed to write file: " + path);
  }
}
}  // namespace

shared_ptr<Session> Session::materialize(const SessionContext& context,
                                         int socketFd,
                                         const OpenRequest& request) {
  string tempDirectory;
  try {
    tempDirectory = createTempDirectory(context.tempRoot);
  } catch (const MaterializationError& me) {
    LOG(ERROR) << me.what();
    context.editorHost->showError("Failed to create rsub temporary directory!");
    throw;
  }

  string tempFilePath = tempDirectory + "/" + request.basename();
  shared_ptr<Session> session(
      new Session(context, socketFd, request, tempDirectory, tempFilePath));
  try {
    writeFile(tempFilePath, request.payload);
    VLOG(1) << "Wrote " << request.payload.length() << " bytes to "
            << tempFilePath;

    auto& editor = context.editorHost;
    EditorHandle handle = editor->openFile(tempFilePath, request.selectionLine());
    session->editorHandle = handle;
    editor->setArtifactMetadata(handle, session->metadata.variables);
    editor->setVisualIndicator(handle, IndicatorKind::REMOTE_FILE);
    editor->setStatus(handle, "rsub_presence", "\xF0\x9F\x94\xB4");
    editor->setStatus(handle, "rsub_status", "rsub: " + request.hostname());
    if (!context.registry->insert(handle, session)) {
      throw MaterializationError("Editor handle " + std::to_string(handle) +
                                 " is already in use");
    }
    editor->bringHostWindowToFront();
  } catch (const std::exception& e) {
    LOG(ERROR) << "Could not open " << request.displayName() << ": "
               << e.what();
    if (session->editorHandle &&
        context.registry->lookup(*session->editorHandle) == session) {
      context.registry->remove(*session->editorHandle);
    }
    // The caller keeps ownership of the socket when materialization fails
    session->socketFd = -1;
    session->removeTempFiles();
    context.editorHost->showError(string("Failed to open ") +
                                  request.displayName() + ": " + e.what());
    if (dynamic_cast<const MaterializationError*>(&e)) {
      throw;
    }
    throw MaterializationError(e.what());
  }

  LOG(INFO) << "Opened " << request.displayName() << " as " << tempFilePath
            << " (handle " << *session->editorHandle << ")";
  return session;
}

Session::Session(const SessionContext& _context, int _socketFd,
                 const OpenRequest& request, const string& _tempDirectory,
                 const string& _tempFilePath)
    : context(_context),
      tempDirectory(_tempDirectory),
      tempFilePath(_tempFilePath),
      socketFd(_socketFd),
      connectionBroken(false) {
  metadata.variables = request.variables;
}

Session::~Session() { VLOG(2) << "Session destroyed: " << getDisplayName(); }

bool Session::notifySaved() {
  lock_guard<std::mutex> guard(connectionMutex);
  if (socketFd < 0 || connectionBroken) {
    LOG(INFO) << "Not sending save for " << getDisplayName()
              << ": connection is gone";
    return false;
  }

  string content;
  {
    std::ifstream in(tempFilePath, std::ios::in | std::ios::binary);
    if (!in.is_open()) {
      LOG(ERROR) << "Cannot read " << tempFilePath << " to send it back";
      return false;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
      LOG(ERROR) << "Error reading " << tempFilePath;
      return false;
    }
    content = ss.str();
  }

  LOG(INFO) << "Saving " << getDisplayName() << " (" << content.length()
            << " bytes)";
  for (const string& line :
       {string("save"), "token: " + getToken(),
        "data: " + std::to_string(content.length())}) {
    if (!send(line + "\n")) {
      return false;
    }
  }
  return send(content) && send("\n");
}

void Session::notifyClosed() {
  if (!editorHandle) {
    return;
  }
  auto self = context.registry->remove(*editorHandle);
  if (!self) {
    VLOG(1) << "Session for " << getDisplayName() << " was already torn down";
    return;
  }

  {
    lock_guard<std::mutex> guard(connectionMutex);
    if (socketFd >= 0) {
      LOG(INFO) << "Closing connection with " << getDisplayName();
      for (const string& line : {string("close"), "token: " + getToken(),
                                 string("")}) {
        if (!send(line + "\n")) {
          break;
        }
      }
      // The connection thread sees end-of-stream and closes the fd
      context.socketHandler->shutdown(socketFd);
      socketFd = -1;
    }
  }
  removeTempFiles();
}

void Session::terminate() {
  if (!editorHandle) {
    return;
  }
  auto self = context.registry->remove(*editorHandle);
  if (!self) {
    VLOG(1) << "Session for " << getDisplayName() << " was already closed";
    return;
  }

  {
    lock_guard<std::mutex> guard(connectionMutex);
    socketFd = -1;
  }

  auto& editor = context.editorHost;
  if (editor->isOpen(*editorHandle)) {
    editor->setStatus(*editorHandle, "rsub_status",
                      "rsub: connection to " + getHostname() + " lost");
    editor->setTitleBroken(*editorHandle);
  }
  removeTempFiles();
}

bool Session::applyFileType() {
  auto fileType = getFileType();
  if (!fileType || !editorHandle) {
    return false;
  }
  auto syntax = context.editorHost->lookupSyntaxForFileType(*fileType);
  if (!syntax) {
    VLOG(1) << "No syntax known for file type " << *fileType;
    return false;
  }
  context.editorHost->setSyntax(*editorHandle, *syntax);
  return true;
}

void Session::detachConnection() {
  lock_guard<std::mutex> guard(connectionMutex);
  socketFd = -1;
}

bool Session::hasConnection() {
  lock_guard<std::mutex> guard(connectionMutex);
  return socketFd >= 0 && !connectionBroken;
}

bool Session::send(const string& data) {
  if (socketFd < 0 || connectionBroken) {
    return false;
  }
  ssize_t written = context.socketHandler->writeAllOrReturn(socketFd, data);
  if (written < 0 || size_t(written) != data.length()) {
    LOG(WARNING) << "Socket connection to the rsub client is broken!";
    connectionBroken = true;
    return false;
  }
  return true;
}

void Session::removeTempFiles() {
  VLOG(1) << "Removing temporary files on disk: " << tempFilePath;
  std::error_code ec;
  fs::remove(tempFilePath, ec);
  if (ec) {
    LOG(WARNING) << "Could not remove " << tempFilePath << ": "
                 << ec.message();
  }
  fs::remove_all(tempDirectory, ec);
  if (ec) {
    LOG(WARNING) << "Could not remove " << tempDirectory << ": "
                 << ec.message();
  }
}
}  // namespace rsub
