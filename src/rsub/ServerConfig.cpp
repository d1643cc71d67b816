#include "ServerConfig.hpp"

#include "SimpleIni.h"

namespace rsub {
namespace {
int parseInt(const string& section, const string& key, const char* value) {
  try {
    size_t pos;
    int parsed = stoi(value, &pos);
    if (pos != strlen(value)) {
      throw std::invalid_argument(value);
    }
    return parsed;
  } catch (const std::logic_error&) {
    throw std::runtime_error("Invalid value for [" + section + "] " + key +
                             ": " + value);
  }
}
}  // namespace

void ServerConfig::loadConfigFile(const string& path) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc < 0) {
    throw std::runtime_error("Invalid config file: " + path);
  }

  const char* hostString = ini.GetValue("Networking", "host", NULL);
  if (hostString) {
    host = hostString;
  }
  const char* portString = ini.GetValue("Networking", "port", NULL);
  if (portString) {
    port = parseInt("Networking", "port", portString);
  }

  const char* commandString = ini.GetValue("Editor", "command", NULL);
  if (commandString) {
    editorCommand = commandString;
  }
  gotoLine = ini.GetBoolValue("Editor", "goto_line", gotoLine);
  editorWaits = ini.GetBoolValue("Editor", "waits", editorWaits);

  const char* tmpdirString = ini.GetValue("Storage", "tmpdir", NULL);
  if (tmpdirString) {
    tempRoot = tmpdirString;
  }

  const char* vlevel = ini.GetValue("Debug", "verbose", NULL);
  if (vlevel) {
    verbose = parseInt("Debug", "verbose", vlevel);
  }
  const char* silentString = ini.GetValue("Debug", "silent", NULL);
  if (silentString) {
    silent = parseInt("Debug", "silent", silentString) != 0;
  }
  const char* logsize = ini.GetValue("Debug", "logsize", NULL);
  if (logsize && parseInt("Debug", "logsize", logsize) > 0) {
    maxLogSize = logsize;
  }
  const char* logdir = ini.GetValue("Debug", "logdir", NULL);
  if (logdir) {
    logDirectory = logdir;
  }
}

void ServerConfig::validate() const {
  if (port < 1 || port > 65535) {
    throw std::runtime_error("Port out of range: " + std::to_string(port));
  }
  if (trim(editorCommand).empty()) {
    throw std::runtime_error("Editor command is empty");
  }
  if (!tempRoot.empty() && !fs::is_directory(tempRoot)) {
    throw std::runtime_error("Temp directory does not exist: " + tempRoot);
  }
}
}  // namespace rsub
