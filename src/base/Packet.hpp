#ifndef __CM_PACKET_H__
#define __CM_PACKET_H__

#include "Headers.hpp"

namespace cm {
/**
 * @brief One frame body on the IPC socket: a header byte naming the message
 * type followed by the message payload.
 *
 * On the wire the serialized packet is preceded by its int64 length, see
 * SocketHandler::writePacket.
 */
class Packet {
 public:
  /** @brief Constructs an empty packet with an invalid header. */
  Packet() : header(255) {}
  /**
   * @brief Builds a packet from the given header/payload tuple.
   */
  Packet(uint8_t _header, const string& _payload)
      : header(_header), payload(_payload) {}
  /**
   * @brief Deserializes a packet from its raw byte representation.
   * @throws std::runtime_error when the header byte is missing.
   */
  explicit Packet(const string& serializedPacket) {
    if (serializedPacket.empty()) {
      throw std::runtime_error("Packet is missing its header byte");
    }
    header = serializedPacket[0];
    payload = serializedPacket.substr(HEADER_SIZE);
  }

  /** @brief Retrieves the application-specific header byte. */
  uint8_t getHeader() const { return header; }
  /** @brief Returns the stored payload. */
  const string& getPayload() const { return payload; }

  string serialize() const {
    string s = "0" + payload;
    s[0] = header;
    return s;
  }

 protected:
  static const int HEADER_SIZE = 1;
  uint8_t header;
  string payload;
};
}  // namespace cm

#endif
