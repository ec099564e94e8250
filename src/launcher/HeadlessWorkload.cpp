#include "HeadlessWorkload.hpp"

namespace cm {
namespace {
// Signals do not wake the condition variable, so poll for them
const std::chrono::milliseconds INTERRUPT_POLL_INTERVAL(100);
}  // namespace

HeadlessWorkload::HeadlessWorkload() : stopRequested(false), revealCount(0) {}

void HeadlessWorkload::run(const LifecycleHooks& hooks) {
  LOG(INFO) << "Running without a user interface, send SIGINT or SIGTERM to "
               "quit";
  if (hooks.onReady) {
    hooks.onReady();
  }

  unique_lock<std::mutex> lock(eventMutex);
  while (true) {
    if (!pendingEvents.empty()) {
      AppLaunchEvent event = pendingEvents.front();
      pendingEvents.pop_front();
      lock.unlock();
      processEvent(event);
      lock.lock();
      continue;
    }
    if (stopRequested) {
      break;
    }
    if (interruptRequested) {
      LOG(INFO) << "Got signal " << interruptRequested << ", quitting";
      break;
    }
    eventCondition.wait_for(lock, INTERRUPT_POLL_INTERVAL);
  }
  lock.unlock();

  if (hooks.onTerminate) {
    hooks.onTerminate();
  }
}

bool HeadlessWorkload::enqueueLaunchEvent(const AppLaunchEvent& event) {
  {
    lock_guard<std::mutex> guard(eventMutex);
    if (pendingEvents.size() >= MAX_PENDING_EVENTS) {
      return false;
    }
    pendingEvents.push_back(event);
  }
  eventCondition.notify_one();
  return true;
}

void HeadlessWorkload::requestStop() {
  {
    lock_guard<std::mutex> guard(eventMutex);
    stopRequested = true;
  }
  eventCondition.notify_one();
}

vector<string> HeadlessWorkload::getOpenedPaths() {
  lock_guard<std::mutex> guard(eventMutex);
  return openedPaths;
}

int HeadlessWorkload::getRevealCount() {
  lock_guard<std::mutex> guard(eventMutex);
  return revealCount;
}

void HeadlessWorkload::processEvent(const AppLaunchEvent& event) {
  VLOG(1) << "Processing " << event;
  switch (event.type) {
    case AppLaunchEvent::OPEN_FILE:
      for (const auto& path : event.paths) {
        CLOG(INFO, "stdout") << "Opening " << path << endl;
        lock_guard<std::mutex> guard(eventMutex);
        openedPaths.push_back(path);
      }
      break;
    case AppLaunchEvent::REVEAL_APP: {
      CLOG(INFO, "stdout") << "Revealing main window" << endl;
      lock_guard<std::mutex> guard(eventMutex);
      revealCount++;
      break;
    }
  }
}
}  // namespace cm
