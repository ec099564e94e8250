#ifndef __CM_IPC_ERRORS_H__
#define __CM_IPC_ERRORS_H__

#include "Headers.hpp"

namespace cm {
/**
 * @brief No candidate socket path could be connected to or bound.
 */
class EndpointError : public std::runtime_error {
 public:
  explicit EndpointError(const string& what) : std::runtime_error(what) {}
};

/**
 * @brief A role-specific operation was called on the wrong role, or on a
 * communicator that is already closed.
 */
class RoleError : public std::logic_error {
 public:
  explicit RoleError(const string& what) : std::logic_error(what) {}
};

/**
 * @brief A frame received on the IPC socket was truncated or malformed.
 */
class FrameDecodeError : public std::runtime_error {
 public:
  explicit FrameDecodeError(const string& what) : std::runtime_error(what) {}
};

/**
 * @brief The workload failed while running.
 */
class WorkloadError : public std::runtime_error {
 public:
  explicit WorkloadError(const string& what) : std::runtime_error(what) {}
};
}  // namespace cm

#endif  // __CM_IPC_ERRORS_H__
