#include "TestFixtures.hpp"

using namespace rsub;

TEST_CASE("Registry insert, lookup and remove", "[SessionRegistry]") {
  SessionFixture f;
  auto fds = f.socketHandler->createPair();
  auto session = Session::materialize(f.context, fds.first,
                                      makeOpenRequest("h:/a", "t", "x"));
  EditorHandle handle = *session->getEditorHandle();

  SessionRegistry registry;
  REQUIRE(registry.insert(handle, session));
  REQUIRE_FALSE(registry.insert(handle, session));
  REQUIRE(registry.size() == 1);
  REQUIRE(registry.lookup(handle) == session);
  REQUIRE(registry.lookup(handle + 1) == nullptr);
  REQUIRE(registry.getHandles() == vector<EditorHandle>({handle}));

  REQUIRE(registry.remove(handle) == session);
  REQUIRE(registry.remove(handle) == nullptr);
  REQUIRE(registry.lookup(handle) == nullptr);
  REQUIRE(registry.size() == 0);
}

TEST_CASE("Concurrent removal hands a session to exactly one caller",
          "[SessionRegistry]") {
  SessionFixture f;
  auto fds = f.socketHandler->createPair();
  auto session = Session::materialize(f.context, fds.first,
                                      makeOpenRequest("h:/a", "t", "x"));

  const int kHandles = 200;
  SessionRegistry registry;
  for (int i = 0; i < kHandles; i++) {
    REQUIRE(registry.insert(i, session));
  }

  std::atomic<int> winners(0);
  vector<std::thread> threads;
  for (int t = 0; t < 4; t++) {
    threads.emplace_back([&registry, &winners]() {
      for (int i = 0; i < kHandles; i++) {
        if (registry.remove(i)) {
          winners++;
        }
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }
  REQUIRE(winners == kHandles);
  REQUIRE(registry.size() == 0);
}
