#ifndef __CM_SOCKET_HANDLER__
#define __CM_SOCKET_HANDLER__

#include "Headers.hpp"
#include "Packet.hpp"

namespace cm {
/**
 * @brief Provides an abstract API for socket reads/writes and lifecycle
 * management.
 */
class SocketHandler {
 public:
  /** @brief Ensures derived handlers can clean up platform-specific resources.
   */
  virtual ~SocketHandler() {}

  /**
   * @brief Reads up to count bytes from fd.
   */
  virtual ssize_t read(int fd, void* buf, size_t count) = 0;
  /**
   * @brief Writes up to count bytes to fd.
   */
  virtual ssize_t write(int fd, const void* buf, size_t count) = 0;

  /**
   * @brief Reads exactly `count` bytes, retrying on EAGAIN until the buffer
   * fills.
   * @param timeout Whether to give up once no byte arrived for
   * SOCKET_DATA_TRANSFER_TIMEOUT seconds.
   * @throws std::runtime_error on timeout, error, or a closed peer.
   */
  void readAll(int fd, void* buf, size_t count, bool timeout);
  /**
   * @brief Attempts to write all bytes, throwing if the operation times out or
   * fails.
   */
  void writeAllOrThrow(int fd, const void* buf, size_t count, bool timeout);

  /**
   * @brief Reads one length-prefixed packet.
   * @returns false when the peer closed the connection cleanly before the
   * first byte of the length prefix.
   * @throws std::runtime_error on an invalid length, a timeout, or a peer that
   * disconnects in the middle of a packet.
   */
  inline bool readPacket(int fd, Packet* packet, bool timeout) {
    int64_t length;
    if (!readAllUnlessClosed(fd, (char*)&length, sizeof(int64_t), timeout)) {
      return false;
    }
    if (length <= 0 || length > MAX_FRAME_LENGTH) {
      // If the message is empty or too big, assume this is a bad packet and
      // throw
      string s("Invalid packet size: ");
      s += std::to_string(length);
      throw std::runtime_error(s.c_str());
    }
    string s(length, '\0');
    readAll(fd, &s[0], length, timeout);
    *packet = Packet(s);
    return true;
  }

  /**
   * @brief Serializes and writes a packet with a leading length prefix.
   */
  inline void writePacket(int fd, const Packet& packet, bool timeout) {
    string s = packet.serialize();
    int64_t length = s.length();
    if (length <= 0 || length > MAX_FRAME_LENGTH) {
      throw std::runtime_error("Invalid packet length: " +
                               std::to_string(length));
    }
    writeAllOrThrow(fd, (const char*)&length, sizeof(int64_t), timeout);
    writeAllOrThrow(fd, &s[0], length, timeout);
  }

  /**
   * @brief Opens a connection to the specified endpoint.
   * @return File descriptor representing the socket, or -1 on failure with
   * errno describing why.
   */
  virtual int connect(const SocketEndpoint& endpoint) = 0;
  /**
   * @brief Starts listening on the endpoint and returns the active listen fds.
   * @return An empty set on failure, with errno describing why.
   */
  virtual set<int> listen(const SocketEndpoint& endpoint) = 0;
  /**
   * @brief Accepts a pending connection on the given listening fd.
   */
  virtual int accept(int fd) = 0;
  /**
   * @brief Stops accepting new connections on the given endpoint.
   */
  virtual void stopListening(const SocketEndpoint& endpoint) = 0;
  /** @brief Closes the supplied socket descriptor. */
  virtual void close(int fd) = 0;

 protected:
  /**
   * @brief Same as readAll, but returns false instead of throwing when the
   * peer closed before any byte was read.
   */
  bool readAllUnlessClosed(int fd, void* buf, size_t count, bool timeout);
};
}  // namespace cm

#endif  // __CM_SOCKET_HANDLER__
