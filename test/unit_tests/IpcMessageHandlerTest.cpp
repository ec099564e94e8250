#include "FakeWorkload.hpp"
#include "IpcMessageHandler.hpp"
#include "TestHeaders.hpp"

using namespace cm;

TEST_CASE("Launch args become an open file event", "[IpcMessageHandler]") {
  auto workload = make_shared<FakeWorkload>();
  IpcMessageHandler handler(workload);

  handler.handleLaunchArgs({"/tmp/a.cryptomator", "b.txt"});

  auto events = workload->getEvents();
  REQUIRE(events.size() == 1);
  REQUIRE(events[0].type == AppLaunchEvent::OPEN_FILE);
  REQUIRE(events[0].paths == vector<string>({"/tmp/a.cryptomator", "b.txt"}));
}

TEST_CASE("Arguments that are not paths are dropped", "[IpcMessageHandler]") {
  auto workload = make_shared<FakeWorkload>();
  IpcMessageHandler handler(workload);

  SECTION("Nothing left") {
    handler.handleLaunchArgs({});
    handler.handleLaunchArgs({""});
    handler.handleLaunchArgs({string("a\0b", 3)});
    REQUIRE(workload->getEvents().empty());
  }

  SECTION("Some left") {
    handler.handleLaunchArgs({"", "/vault", string("bad\0path", 8)});
    auto events = workload->getEvents();
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].paths == vector<string>({"/vault"}));
  }
}

TEST_CASE("Messages are dispatched by type", "[IpcMessageHandler]") {
  auto workload = make_shared<FakeWorkload>();
  IpcMessageHandler handler(workload);

  handler.onMessage(IpcMessage::handleLaunchArgs({"/vault"}));
  handler.onMessage(IpcMessage::revealRunningApp());
  handler.onMessage(IpcMessage::handleLaunchArgs({}));

  auto events = workload->getEvents();
  REQUIRE(events.size() == 2);
  REQUIRE(events[0].type == AppLaunchEvent::OPEN_FILE);
  REQUIRE(events[1].type == AppLaunchEvent::REVEAL_APP);
  REQUIRE(events[1].paths.empty());
}

TEST_CASE("A full queue does not throw", "[IpcMessageHandler]") {
  auto workload = make_shared<FakeWorkload>();
  workload->rejectEvents();
  IpcMessageHandler handler(workload);

  REQUIRE_NOTHROW(handler.onMessage(IpcMessage::revealRunningApp()));
  REQUIRE(workload->getEvents().empty());
}
