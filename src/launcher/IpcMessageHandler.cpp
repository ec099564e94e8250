#include "IpcMessageHandler.hpp"

namespace cm {
IpcMessageHandler::IpcMessageHandler(shared_ptr<Workload> _workload)
    : workload(_workload) {}

void IpcMessageHandler::handleLaunchArgs(const vector<string>& args) {
  vector<string> paths;
  for (const auto& arg : args) {
    if (arg.empty() || arg.find('\0') != string::npos) {
      VLOG(1) << "Ignoring launch argument that is not a valid path";
      continue;
    }
    paths.push_back(arg);
  }
  if (paths.empty()) {
    return;
  }
  enqueue(AppLaunchEvent{AppLaunchEvent::OPEN_FILE, paths});
}

void IpcMessageHandler::onMessage(const IpcMessage& message) {
  switch (message.getType()) {
    case IpcMessageType::HANDLE_LAUNCH_ARGS:
      handleLaunchArgs(message.getArgs());
      break;
    case IpcMessageType::REVEAL_RUNNING_APP:
      enqueue(AppLaunchEvent{AppLaunchEvent::REVEAL_APP, {}});
      break;
  }
}

void IpcMessageHandler::enqueue(const AppLaunchEvent& event) {
  if (!workload->enqueueLaunchEvent(event)) {
    LOG(ERROR) << "Could not enqueue application launch event " << event;
  }
}
}  // namespace cm
