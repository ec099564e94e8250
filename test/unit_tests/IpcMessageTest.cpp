#include "IpcMessage.hpp"
#include "TestHeaders.hpp"

using namespace cm;

TEST_CASE("Launch args survive encoding in order", "[IpcMessage]") {
  vector<string> args = {"/home/user/vault/masterkey.cryptomator",
                         "relative/path", "spaces in name", "\xc3\xa4\xc3\xb6"};
  Packet packet = IpcMessage::handleLaunchArgs(args).toPacket();
  REQUIRE(packet.getHeader() == '1');

  IpcMessage decoded = IpcMessage::fromPacket(packet);
  REQUIRE(decoded.getType() == IpcMessageType::HANDLE_LAUNCH_ARGS);
  REQUIRE(decoded.getArgs() == args);
}

TEST_CASE("Launch args may be empty", "[IpcMessage]") {
  Packet packet = IpcMessage::handleLaunchArgs({}).toPacket();
  IpcMessage decoded = IpcMessage::fromPacket(packet);
  REQUIRE(decoded.getType() == IpcMessageType::HANDLE_LAUNCH_ARGS);
  REQUIRE(decoded.getArgs().empty());
}

TEST_CASE("Launch args payload announces the count first", "[IpcMessage]") {
  Packet packet = IpcMessage::handleLaunchArgs({"a", "b"}).toPacket();
  LaunchArgsPayload payload;
  REQUIRE(payload.ParseFromString(packet.getPayload()));
  REQUIRE(payload.arg_count() == 2);
  REQUIRE(payload.args_size() == 2);
  // Field 1 (varint) is the first byte on the wire
  REQUIRE(packet.getPayload()[0] == 0x08);
}

TEST_CASE("Reveal request has an empty payload", "[IpcMessage]") {
  Packet packet = IpcMessage::revealRunningApp().toPacket();
  REQUIRE(packet.getHeader() == '2');
  REQUIRE(packet.getPayload().empty());
  REQUIRE(packet.serialize() == "2");
  REQUIRE(IpcMessage::fromPacket(packet) == IpcMessage::revealRunningApp());
}

TEST_CASE("Malformed frames are rejected", "[IpcMessage]") {
  SECTION("Unknown header") {
    REQUIRE_THROWS_AS(IpcMessage::fromPacket(Packet('9', "")),
                      FrameDecodeError);
  }

  SECTION("Unparseable payload") {
    REQUIRE_THROWS_AS(
        IpcMessage::fromPacket(Packet('1', string("\xff\xff\xff", 3))),
        FrameDecodeError);
  }

  SECTION("Count does not match the arguments") {
    LaunchArgsPayload payload;
    payload.set_arg_count(3);
    payload.add_args("only one");
    REQUIRE_THROWS_AS(
        IpcMessage::fromPacket(Packet('1', protoToString(payload))),
        FrameDecodeError);
  }

  SECTION("Missing count") {
    LaunchArgsPayload payload;
    payload.add_args("no count");
    REQUIRE_THROWS_AS(
        IpcMessage::fromPacket(Packet('1', protoToString(payload))),
        FrameDecodeError);
  }

  SECTION("Reveal request with payload") {
    REQUIRE_THROWS_AS(IpcMessage::fromPacket(Packet('2', "unexpected")),
                      FrameDecodeError);
  }
}

TEST_CASE("Packet rejects a frame without header", "[IpcMessage]") {
  REQUIRE_THROWS_AS(Packet(string()), std::runtime_error);
}
