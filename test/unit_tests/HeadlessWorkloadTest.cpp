#include "HeadlessWorkload.hpp"
#include "TestHeaders.hpp"

using namespace cm;

TEST_CASE("Queued events are processed before stopping",
          "[HeadlessWorkload]") {
  HeadlessWorkload workload;
  REQUIRE(workload.enqueueLaunchEvent(
      AppLaunchEvent{AppLaunchEvent::OPEN_FILE, {"/a", "/b"}}));
  REQUIRE(workload.enqueueLaunchEvent(
      AppLaunchEvent{AppLaunchEvent::REVEAL_APP, {}}));
  workload.requestStop();

  bool ready = false;
  bool terminated = false;
  LifecycleHooks hooks;
  hooks.onReady = [&ready]() { ready = true; };
  hooks.onTerminate = [&terminated]() { terminated = true; };
  workload.run(hooks);

  REQUIRE(ready);
  REQUIRE(terminated);
  REQUIRE(workload.getOpenedPaths() == vector<string>({"/a", "/b"}));
  REQUIRE(workload.getRevealCount() == 1);
}

TEST_CASE("Events from another thread reach a running workload",
          "[HeadlessWorkload]") {
  HeadlessWorkload workload;
  std::thread runThread([&workload]() { workload.run(LifecycleHooks()); });

  REQUIRE(workload.enqueueLaunchEvent(
      AppLaunchEvent{AppLaunchEvent::OPEN_FILE, {"/vault"}}));
  REQUIRE(WaitUntil([&workload]() {
    return workload.getOpenedPaths() == vector<string>({"/vault"});
  }));

  workload.requestStop();
  runThread.join();
}

TEST_CASE("The event queue is bounded", "[HeadlessWorkload]") {
  HeadlessWorkload workload;
  for (size_t i = 0; i < HeadlessWorkload::MAX_PENDING_EVENTS; i++) {
    REQUIRE(workload.enqueueLaunchEvent(
        AppLaunchEvent{AppLaunchEvent::REVEAL_APP, {}}));
  }
  REQUIRE(!workload.enqueueLaunchEvent(
      AppLaunchEvent{AppLaunchEvent::REVEAL_APP, {}}));
}
