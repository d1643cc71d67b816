#include "EditorDispatcher.hpp"
#include "TestHeaders.hpp"

using namespace rsub;

TEST_CASE("Posted work runs in order on one thread", "[EditorDispatcher]") {
  EditorDispatcher dispatcher;
  vector<int> order;
  set<std::thread::id> threadIds;
  vector<std::future<void>> futures;
  for (int i = 0; i < 50; i++) {
    futures.push_back(dispatcher.post([i, &order, &threadIds]() {
      order.push_back(i);
      threadIds.insert(std::this_thread::get_id());
    }));
  }
  for (auto& future : futures) {
    future.get();
  }
  REQUIRE(order.size() == 50);
  REQUIRE(std::is_sorted(order.begin(), order.end()));
  REQUIRE(threadIds.size() == 1);
  REQUIRE(threadIds.count(std::this_thread::get_id()) == 0);
}

TEST_CASE("Results and exceptions come back through the future",
          "[EditorDispatcher]") {
  EditorDispatcher dispatcher;
  REQUIRE(dispatcher.post([]() { return 42; }).get() == 42);
  auto failing = dispatcher.post(
      []() -> int { throw std::runtime_error("editor failure"); });
  REQUIRE_THROWS_AS(failing.get(), std::runtime_error);
}

TEST_CASE("Shutdown drains queued work and refuses more",
          "[EditorDispatcher]") {
  EditorDispatcher dispatcher;
  std::atomic<int> ran(0);
  for (int i = 0; i < 10; i++) {
    dispatcher.post([&ran]() {
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
      ran++;
    });
  }
  dispatcher.shutdown();
  REQUIRE(ran == 10);
  REQUIRE_THROWS_AS(dispatcher.post([]() {}), std::runtime_error);
  dispatcher.shutdown();
}
