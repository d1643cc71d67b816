#include "OpenRequest.hpp"

namespace rsub {
string OpenRequest::get(const string& name) const {
  auto it = variables.find(name);
  if (it == variables.end()) {
    return "";
  }
  return it->second;
}

string OpenRequest::hostname() const {
  string name = displayName();
  return name.substr(0, name.find(':'));
}

string OpenRequest::basename() const {
  string name = displayName();
  auto colonPos = name.rfind(':');
  string path = (colonPos == string::npos) ? name : name.substr(colonPos + 1);
  auto slashPos = path.rfind('/');
  if (slashPos != string::npos) {
    path = path.substr(slashPos + 1);
  }
  if (path.empty() || path == "." || path == "..") {
    return "untitled";
  }
  return path;
}

optional<int> OpenRequest::selectionLine() const {
  string selection = get("selection");
  // Anything longer than 9 digits is not a line number we can jump to
  if (!isAllDigits(selection) || selection.length() > 9) {
    return nullopt;
  }
  return stoi(selection);
}

optional<string> OpenRequest::fileType() const {
  string fileType = get("file-type");
  if (fileType.empty()) {
    return nullopt;
  }
  return fileType;
}
}  // namespace rsub
