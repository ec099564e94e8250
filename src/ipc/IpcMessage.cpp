#include "IpcMessage.hpp"

namespace cm {
IpcMessage IpcMessage::handleLaunchArgs(const vector<string>& args) {
  return IpcMessage(IpcMessageType::HANDLE_LAUNCH_ARGS, args);
}

IpcMessage IpcMessage::revealRunningApp() {
  return IpcMessage(IpcMessageType::REVEAL_RUNNING_APP, vector<string>());
}

Packet IpcMessage::toPacket() const {
  switch (type) {
    case IpcMessageType::HANDLE_LAUNCH_ARGS: {
      LaunchArgsPayload payload;
      payload.set_arg_count(args.size());
      for (const auto& arg : args) {
        payload.add_args(arg);
      }
      return Packet(uint8_t(type), protoToString(payload));
    }
    case IpcMessageType::REVEAL_RUNNING_APP:
      return Packet(uint8_t(type), "");
  }
  STFATAL << "Unhandled message type: " << int(type);
  return Packet();
}

IpcMessage IpcMessage::fromPacket(const Packet& packet) {
  switch (IpcMessageType(packet.getHeader())) {
    case IpcMessageType::HANDLE_LAUNCH_ARGS: {
      LaunchArgsPayload payload;
      if (!payload.ParseFromString(packet.getPayload())) {
        throw FrameDecodeError("Invalid launch args payload");
      }
      if (!payload.has_arg_count() ||
          payload.arg_count() != uint32_t(payload.args_size())) {
        throw FrameDecodeError(
            "Launch args count mismatch: announced " +
            to_string(payload.arg_count()) + ", got " +
            to_string(payload.args_size()));
      }
      return handleLaunchArgs(
          vector<string>(payload.args().begin(), payload.args().end()));
    }
    case IpcMessageType::REVEAL_RUNNING_APP:
      if (!packet.getPayload().empty()) {
        throw FrameDecodeError("Unexpected payload on reveal request");
      }
      return revealRunningApp();
  }
  throw FrameDecodeError("Unknown message header: " +
                         to_string(int(packet.getHeader())));
}

std::ostream& operator<<(std::ostream& os, const IpcMessage& message) {
  switch (message.getType()) {
    case IpcMessageType::HANDLE_LAUNCH_ARGS:
      os << "HandleLaunchArgs(" << message.getArgs().size() << " args)";
      break;
    case IpcMessageType::REVEAL_RUNNING_APP:
      os << "RevealRunningApp";
      break;
  }
  return os;
}
}  // namespace cm
