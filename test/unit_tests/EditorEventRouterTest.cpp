#include "EditorEventRouter.hpp"
#include "TestFixtures.hpp"

using namespace rsub;

TEST_CASE("Events for unknown handles are dropped", "[EditorEventRouter]") {
  auto registry = make_shared<SessionRegistry>();
  EditorEventRouter router(registry);
  REQUIRE_FALSE(router.onSaved(1));
  REQUIRE_FALSE(router.onClosed(1));
  REQUIRE_FALSE(router.onLoaded(1));
}

TEST_CASE("Events reach the session that owns the handle",
          "[EditorEventRouter]") {
  SessionFixture f;
  f.editorHost->knownSyntaxes["rb"] = "Ruby";
  auto fds = f.socketHandler->createPair();
  auto session = Session::materialize(
      f.context, fds.first,
      makeOpenRequest("h:/a.rb", "tok", "puts 1\n", {{"file-type", "rb"}}));
  EditorHandle handle = *session->getEditorHandle();
  EditorEventRouter router(f.registry);

  REQUIRE(router.onLoaded(handle));
  REQUIRE(f.editorHost->appliedSyntaxes[handle] == "Ruby");

  writeFile(session->getTempFilePath(), "puts 2\n");
  REQUIRE(router.onSaved(handle));
  REQUIRE(router.onClosed(handle));

  string expected =
      "save\ntoken: tok\ndata: 7\nputs 2\n\nclose\ntoken: tok\n\n";
  REQUIRE(readBytes(f.socketHandler, fds.second, expected.length()) ==
          expected);

  // The session is gone: later events are not delivered
  REQUIRE_FALSE(router.onSaved(handle));
  REQUIRE_FALSE(router.onClosed(handle));
}
