#include "TestFixtures.hpp"

using namespace rsub;

TEST_CASE("Materialize opens the payload in the editor", "[Session]") {
  SessionFixture f;
  auto fds = f.socketHandler->createPair();
  auto session = Session::materialize(
      f.context, fds.first,
      makeOpenRequest("devbox:/home/me/notes.txt", "abc", "hello\n",
                      {{"selection", "7"}}));

  REQUIRE(session->getEditorHandle());
  EditorHandle handle = *session->getEditorHandle();
  REQUIRE(readFile(session->getTempFilePath()) == "hello\n");
  REQUIRE(fs::path(session->getTempFilePath()).filename() == "notes.txt");
  REQUIRE(fs::path(session->getTempDirectory()).parent_path() ==
          fs::path(f.tempRoot));
  REQUIRE(fs::path(session->getTempDirectory())
              .filename()
              .string()
              .find("rsub-") == 0);

  REQUIRE(f.editorHost->openedPaths[handle] == session->getTempFilePath());
  REQUIRE(f.editorHost->openedLines[handle] == optional<int>(7));
  REQUIRE(f.editorHost->metadata[handle].at("token") == "abc");
  REQUIRE(f.editorHost->indicators[handle] == IndicatorKind::REMOTE_FILE);
  REQUIRE(f.editorHost->getStatus(handle, "rsub_status") == "rsub: devbox");
  REQUIRE_FALSE(f.editorHost->getStatus(handle, "rsub_presence").empty());
  REQUIRE(f.editorHost->frontCount == 1);
  REQUIRE(f.registry->lookup(handle) == session);
  REQUIRE(session->hasConnection());
}

TEST_CASE("Save sends the file back with its token", "[Session]") {
  SessionFixture f;
  auto fds = f.socketHandler->createPair();
  auto session = Session::materialize(
      f.context, fds.first, makeOpenRequest("h:/x/y.txt", "abc", "hello"));

  writeFile(session->getTempFilePath(), "HELLO");
  REQUIRE(session->notifySaved());

  string expected = "save\ntoken: abc\ndata: 5\nHELLO\n";
  REQUIRE(readBytes(f.socketHandler, fds.second, expected.length()) ==
          expected);
}

TEST_CASE("Unmodified file is sent back byte for byte", "[Session]") {
  SessionFixture f;
  auto fds = f.socketHandler->createPair();
  string payload("line one\r\n\0binary\xff\n.\n", 21);
  auto session = Session::materialize(f.context, fds.first,
                                      makeOpenRequest("h:/b.bin", "rt", payload));
  REQUIRE(session->notifySaved());

  string expected = "save\ntoken: rt\ndata: 21\n" + payload + "\n";
  REQUIRE(readBytes(f.socketHandler, fds.second, expected.length()) ==
          expected);
}

TEST_CASE("Every save is sent", "[Session]") {
  SessionFixture f;
  auto fds = f.socketHandler->createPair();
  auto session = Session::materialize(f.context, fds.first,
                                      makeOpenRequest("h:f", "t", "1"));

  writeFile(session->getTempFilePath(), "22");
  REQUIRE(session->notifySaved());
  writeFile(session->getTempFilePath(), "");
  REQUIRE(session->notifySaved());

  string expected = "save\ntoken: t\ndata: 2\n22\nsave\ntoken: t\ndata: 0\n\n";
  REQUIRE(readBytes(f.socketHandler, fds.second, expected.length()) ==
          expected);
}

TEST_CASE("Close tells the client and cleans up once", "[Session]") {
  SessionFixture f;
  auto fds = f.socketHandler->createPair();
  auto session = Session::materialize(f.context, fds.first,
                                      makeOpenRequest("h:/a.txt", "tok", "x"));
  string tempDirectory = session->getTempDirectory();
  EditorHandle handle = *session->getEditorHandle();

  session->notifyClosed();

  string expected = "close\ntoken: tok\n\n";
  REQUIRE(readBytes(f.socketHandler, fds.second, expected.length()) ==
          expected);
  REQUIRE(waitForEof(f.socketHandler, fds.second));
  REQUIRE_FALSE(fs::exists(tempDirectory));
  REQUIRE(f.registry->size() == 0);
  REQUIRE_FALSE(session->hasConnection());

  // A late terminate or second close changes nothing
  session->terminate();
  session->notifyClosed();
  REQUIRE(f.editorHost->brokenTitles.empty());
  REQUIRE(f.editorHost->getStatus(handle, "rsub_status") == "rsub: h");
  REQUIRE_FALSE(session->notifySaved());
}

TEST_CASE("Terminate marks the open file as disconnected", "[Session]") {
  SessionFixture f;
  auto fds = f.socketHandler->createPair();
  auto session = Session::materialize(
      f.context, fds.first, makeOpenRequest("server1:/a.txt", "tok", "x"));
  string tempDirectory = session->getTempDirectory();
  EditorHandle handle = *session->getEditorHandle();

  session->detachConnection();
  session->terminate();

  REQUIRE(f.editorHost->getStatus(handle, "rsub_status") ==
          "rsub: connection to server1 lost");
  REQUIRE(f.editorHost->brokenTitles.count(handle) == 1);
  REQUIRE_FALSE(fs::exists(tempDirectory));
  REQUIRE(f.registry->size() == 0);

  // Nothing was sent to the client
  REQUIRE(readBytes(f.socketHandler, fds.second, 1, 1).empty());

  session->notifyClosed();
  REQUIRE(readBytes(f.socketHandler, fds.second, 1, 1).empty());
}

TEST_CASE("Terminate leaves a file the user already closed alone",
          "[Session]") {
  SessionFixture f;
  auto fds = f.socketHandler->createPair();
  auto session = Session::materialize(f.context, fds.first,
                                      makeOpenRequest("h:/a.txt", "t", "x"));
  EditorHandle handle = *session->getEditorHandle();
  f.editorHost->closeFile(handle);

  session->terminate();

  REQUIRE(f.editorHost->brokenTitles.empty());
  REQUIRE(f.editorHost->getStatus(handle, "rsub_status") == "rsub: h");
  REQUIRE(f.registry->size() == 0);
}

TEST_CASE("Same basename from two clients gets two directories",
          "[Session]") {
  SessionFixture f;
  auto fds1 = f.socketHandler->createPair();
  auto fds2 = f.socketHandler->createPair();
  auto first = Session::materialize(
      f.context, fds1.first, makeOpenRequest("a:/etc/config", "1", "one"));
  auto second = Session::materialize(
      f.context, fds2.first, makeOpenRequest("b:/srv/config", "2", "two"));

  REQUIRE(first->getTempDirectory() != second->getTempDirectory());
  REQUIRE(readFile(first->getTempFilePath()) == "one");
  REQUIRE(readFile(second->getTempFilePath()) == "two");
  REQUIRE(f.registry->size() == 2);
  REQUIRE(countEntries(f.tempRoot) == 2);
}

TEST_CASE("Editor failure leaves nothing behind", "[Session]") {
  SessionFixture f;
  auto fds = f.socketHandler->createPair();
  f.editorHost->failOpen = true;

  REQUIRE_THROWS_AS(Session::materialize(f.context, fds.first,
                                         makeOpenRequest("h:/a", "t", "x")),
                    MaterializationError);
  REQUIRE(countEntries(f.tempRoot) == 0);
  REQUIRE(f.registry->size() == 0);
  REQUIRE(f.editorHost->getErrorCount() == 1);
}

TEST_CASE("Write failure leaves nothing behind", "[Session]") {
  SessionFixture f;
  auto fds = f.socketHandler->createPair();

  // A basename longer than NAME_MAX cannot be created
  REQUIRE_THROWS_AS(
      Session::materialize(f.context, fds.first,
                           makeOpenRequest("h:/" + string(300, 'a'), "t", "x")),
      MaterializationError);
  REQUIRE(countEntries(f.tempRoot) == 0);
  REQUIRE(f.registry->size() == 0);
  REQUIRE(f.editorHost->openedPaths.empty());
  REQUIRE(f.editorHost->getErrorCount() == 1);
}

TEST_CASE("Duplicate editor handle is a materialization error",
          "[Session]") {
  SessionFixture f;
  auto fds = f.socketHandler->createPair();
  f.editorHost->forcedHandle = 9;
  auto first = Session::materialize(f.context, fds.first,
                                    makeOpenRequest("h:/a", "t", "x"));

  REQUIRE_THROWS_AS(Session::materialize(f.context, fds.first,
                                         makeOpenRequest("h:/b", "u", "y")),
                    MaterializationError);
  REQUIRE(f.registry->lookup(9) == first);
  REQUIRE(countEntries(f.tempRoot) == 1);
}

TEST_CASE("Missing temp root is reported", "[Session]") {
  SessionFixture f;
  auto fds = f.socketHandler->createPair();
  f.context.tempRoot = f.tempRoot + "/does/not/exist";

  REQUIRE_THROWS_AS(Session::materialize(f.context, fds.first,
                                         makeOpenRequest("h:/a", "t", "x")),
                    MaterializationError);
  REQUIRE(f.editorHost->errors.size() == 1);
  REQUIRE(f.editorHost->errors[0] ==
          "Failed to create rsub temporary directory!");
  REQUIRE(f.editorHost->openedPaths.empty());
}

TEST_CASE("Save after the client vanished fails quietly", "[Session]") {
  SessionFixture f;
  auto fds = f.socketHandler->createPair();
  auto session = Session::materialize(f.context, fds.first,
                                      makeOpenRequest("h:/a", "t", "x"));
  f.socketHandler->close(fds.second);

  REQUIRE_FALSE(session->notifySaved());
  REQUIRE_FALSE(session->hasConnection());
  REQUIRE_FALSE(session->notifySaved());
}

TEST_CASE("File type selects a syntax when the editor knows it",
          "[Session]") {
  SessionFixture f;
  f.editorHost->knownSyntaxes["py"] = "Python";
  auto fds = f.socketHandler->createPair();
  auto known = Session::materialize(
      f.context, fds.first,
      makeOpenRequest("h:/a", "t", "x", {{"file-type", "py"}}));
  auto unknown = Session::materialize(
      f.context, fds.first,
      makeOpenRequest("h:/b", "u", "y", {{"file-type", "zz"}}));
  auto untyped = Session::materialize(f.context, fds.first,
                                      makeOpenRequest("h:/c", "v", "z"));

  REQUIRE(known->applyFileType());
  REQUIRE(f.editorHost->appliedSyntaxes[*known->getEditorHandle()] ==
          "Python");
  REQUIRE_FALSE(unknown->applyFileType());
  REQUIRE_FALSE(untyped->applyFileType());
  REQUIRE(f.editorHost->appliedSyntaxes.size() == 1);
}
