#include "IpcSocketPath.hpp"

namespace cm {

namespace {

const string SOCKET_BASENAME = "ipc.socket";

bool IsAbsolutePath(const string& path) {
  return (!path.empty() && path[0] == '/');
}

void TryCreateDirectory(const string& dir, mode_t mode) {
  // Reset umask to 0 while creating the directory, and restore after.
  const mode_t oldMode = ::umask(0);
  if (::mkdir(dir.c_str(), mode) == -1 && errno != EEXIST) {
    LOG(WARNING) << "Unable to create " << dir << ": " << strerror(errno);
  }
  ::umask(oldMode);
}

}  // namespace

IpcSocketPath::IpcSocketPath() = default;

void IpcSocketPath::setPathOverrides(const vector<string>& paths) {
  vector<string> expanded;
  for (const auto& path : paths) {
    if (path.empty()) {
      VLOG(1) << "Ignoring empty IPC socket path";
      continue;
    }
    expanded.push_back(ExpandTilde(path));
  }
  if (expanded.empty()) {
    return;
  }
  pathOverrides = expanded;
}

vector<string> IpcSocketPath::getPaths() {
  if (pathOverrides) {
    return pathOverrides.value();
  }

  vector<string> paths;
  if (const char* runtimeDir = getenv("XDG_RUNTIME_DIR")) {
    // XDG: a relative path is invalid and must be ignored
    if (IsAbsolutePath(runtimeDir)) {
      paths.push_back(string(runtimeDir) + "/" + APPLICATION_NAME + "/" +
                      SOCKET_BASENAME);
    }
  }
  paths.push_back(sago::getConfigHome() + "/" + APPLICATION_NAME + "/" +
                  SOCKET_BASENAME);
  return paths;
}

vector<SocketEndpoint> IpcSocketPath::getCandidates() {
  vector<SocketEndpoint> candidates;
  for (const auto& path : getPaths()) {
    SocketEndpoint endpoint;
    endpoint.set_name(path);
    candidates.push_back(endpoint);
  }
  return candidates;
}

void IpcSocketPath::createDirectoriesIfRequired() {
  for (const auto& path : getPaths()) {
    fs::path parent = fs::path(path).parent_path();
    if (parent.empty()) {
      continue;
    }
    std::error_code ec;
    if (fs::exists(parent, ec)) {
      continue;
    }
    if (parent.has_parent_path()) {
      fs::create_directories(parent.parent_path(), ec);
      if (ec) {
        LOG(WARNING) << "Unable to create " << parent.parent_path().string()
                     << ": " << ec.message();
        continue;
      }
    }
    TryCreateDirectory(parent.string(), 0700);
  }
}

}  // namespace cm
