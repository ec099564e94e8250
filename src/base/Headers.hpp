#ifndef __CM_HEADERS__
#define __CM_HEADERS__

#if __FreeBSD__
#define _WITH_GETLINE
#endif

#include <errno.h>
#include <fcntl.h>
#include <paths.h>
#include <pthread.h>
#include <signal.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/file.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/un.h>
#include <sys/utsname.h>
#include <time.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <ctime>
#include <deque>
#include <exception>
#include <filesystem>
#include <fstream>
#include <functional>
#include <future>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include <google/protobuf/message_lite.h>

#include "CM.pb.h"
#include "ThreadPool.h"
#include "easylogging++.h"
#include "sago/platform_folders.h"
#include "ust.hpp"

using namespace std;
namespace fs = std::filesystem;

#ifndef CM_VERSION
#define CM_VERSION "SNAPSHOT"
#endif

#ifndef CM_BUILD
#define CM_BUILD "SNAPSHOT"
#endif

// Name shown in the version line and used for per-user directories
const string APPLICATION_NAME = "Cryptomator";

// Frames above this size are rejected by both sides of the IPC socket
const int64_t MAX_FRAME_LENGTH = 16 * 1024 * 1024;

#define STFATAL LOG(FATAL) << "Stack Trace: " << endl << ust::generate()

#define STERROR LOG(ERROR) << "Stack Trace: " << endl << ust::generate()

#define FATAL_FAIL(X) \
  if (((X) == -1))    \
    STFATAL << "Error: (" << GetErrno() << "): " << strerror(GetErrno());

// On BSD/OSX we can get EINVAL if the remote side has closed the connection
// before we have initialized it.
#define FATAL_FAIL_UNLESS_EINVAL(X)        \
  if (((X) == -1) && GetErrno() != EINVAL) \
    STFATAL << "Error: (" << GetErrno() << "): " << strerror(GetErrno());

inline int GetErrno() { return errno; }

inline void SetErrno(int e) { errno = e; }

namespace cm {
inline std::ostream &operator<<(std::ostream &os,
                                const cm::SocketEndpoint &se) {
  if (se.has_name()) {
    os << se.name();
  }
  return os;
}

template <typename Out>
inline void split(const std::string &s, char delim, Out result) {
  std::stringstream ss;
  ss.str(s);
  std::string item;
  while (std::getline(ss, item, delim)) {
    *(result++) = item;
  }
}

inline std::vector<std::string> split(const std::string &s, char delim) {
  std::vector<std::string> elems;
  split(s, delim, std::back_inserter(elems));
  return elems;
}

template <typename T>
inline string protoToString(const T &t) {
  string s;
  if (!t.SerializeToString(&s)) {
    STFATAL << "Error serializing proto to string";
  }
  return s;
}

inline bool waitOnSocketData(int fd) {
  fd_set fdset;
  FD_ZERO(&fdset);
  FD_SET(fd, &fdset);
  timeval tv;
  tv.tv_sec = 1;
  tv.tv_usec = 0;
  VLOG(4) << "Before selecting sockFd";
  int result = select(fd + 1, &fdset, NULL, NULL, &tv);
  if (result == -1 && GetErrno() == EINTR) {
    // Interrupted by SIGINT/SIGTERM, callers retry
    return false;
  }
  FATAL_FAIL(result);
  return FD_ISSET(fd, &fdset);
}

inline string GetTempDirectory() {
  string tmpDir = _PATH_TMP;
  return tmpDir;
}

inline int64_t MillisecondsSince(
    const std::chrono::steady_clock::time_point &start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now() - start)
      .count();
}

inline void HandleTerminate() {
  static bool first = true;
  if (first) {
    first = false;
  } else {
    // If we are recursively terminating, just bail
    return;
  }
  std::set_terminate([]() -> void {
    std::exception_ptr eptr = std::current_exception();
    if (eptr) {
      try {
        std::rethrow_exception(eptr);
      } catch (const std::exception &e) {
        STFATAL << "Uncaught c++ exception: " << e.what();
      }
    } else {
      STFATAL << "Uncaught c++ exception (unknown)";
    }
  });
}

/** @brief Set from signal context; polled by long-running loops. */
extern volatile sig_atomic_t interruptRequested;

/**
 * @brief Records SIGINT/SIGTERM so the workload loop can wind down and the
 * normal shutdown path (and with it the endpoint release) still runs.
 */
inline void InterruptSignalHandler(int signum) { interruptRequested = signum; }

inline string GetOsDescription() {
  struct utsname info;
  if (::uname(&info) == -1) {
    return "unknown OS";
  }
  return string(info.sysname) + " " + info.release + " (" + info.machine +
         ")";
}

inline string ExpandTilde(const string &path) {
  if (path.empty() || path[0] != '~') {
    return path;
  }
  if (path.length() > 1 && path[1] != '/') {
    // ~user forms are not supported
    return path;
  }
  const char *home = getenv("HOME");
  if (!home) {
    return path;
  }
  return string(home) + path.substr(1);
}
}  // namespace cm

#endif
