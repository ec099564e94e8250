#ifndef __CM_IPC_MESSAGE_H__
#define __CM_IPC_MESSAGE_H__

#include "Headers.hpp"
#include "IpcErrors.hpp"
#include "Packet.hpp"

namespace cm {
/**
 * @brief Header byte of every frame sent to the running instance.
 */
enum class IpcMessageType : uint8_t {
  /** @brief Launch arguments to process, payload is a LaunchArgsPayload. */
  HANDLE_LAUNCH_ARGS = '1',
  /** @brief Bring the main window to the foreground, empty payload. */
  REVEAL_RUNNING_APP = '2',
};

/**
 * @brief A message exchanged between a client instance and the running
 * instance.
 */
class IpcMessage {
 public:
  static IpcMessage handleLaunchArgs(const vector<string>& args);
  static IpcMessage revealRunningApp();

  /**
   * @brief Decodes a received packet.
   * @throws FrameDecodeError for unknown headers and malformed payloads.
   */
  static IpcMessage fromPacket(const Packet& packet);

  /** @brief Encodes the message into a packet ready for writePacket(). */
  Packet toPacket() const;

  inline IpcMessageType getType() const { return type; }
  /** @brief Launch arguments, always empty for REVEAL_RUNNING_APP. */
  inline const vector<string>& getArgs() const { return args; }

  bool operator==(const IpcMessage& other) const {
    return type == other.type && args == other.args;
  }

 protected:
  IpcMessage(IpcMessageType _type, const vector<string>& _args)
      : type(_type), args(_args) {}

  IpcMessageType type;
  vector<string> args;
};

std::ostream& operator<<(std::ostream& os, const IpcMessage& message);
}  // namespace cm

#endif  // __CM_IPC_MESSAGE_H__
