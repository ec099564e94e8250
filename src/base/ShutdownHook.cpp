#include "ShutdownHook.hpp"

namespace cm {
ShutdownHook* ShutdownHook::installed = NULL;
std::mutex ShutdownHook::installedMutex;

ShutdownHook::ShutdownHook() : ran(false) {}

ShutdownHook::~ShutdownHook() {
  lock_guard<std::mutex> guard(installedMutex);
  if (installed == this) {
    installed = NULL;
  }
}

void ShutdownHook::runOnShutdown(function<void()> hook) {
  {
    lock_guard<std::mutex> guard(hookMutex);
    if (!ran) {
      hooks.push_back(hook);
      return;
    }
  }
  LOG(WARNING) << "Shutdown hook registered after shutdown, running it now";
  hook();
}

void ShutdownHook::runHooks() {
  vector<function<void()>> toRun;
  {
    lock_guard<std::mutex> guard(hookMutex);
    if (ran) {
      return;
    }
    ran = true;
    toRun.swap(hooks);
  }
  VLOG(1) << "Running " << toRun.size() << " shutdown hooks";
  for (auto& hook : toRun) {
    try {
      hook();
    } catch (const std::exception& e) {
      LOG(ERROR) << "Shutdown hook failed: " << e.what();
    }
  }
}

void ShutdownHook::installAtExit() {
  lock_guard<std::mutex> guard(installedMutex);
  static bool registered = false;
  if (installed != NULL && installed != this) {
    throw std::logic_error("Another ShutdownHook is already installed");
  }
  installed = this;
  if (!registered) {
    registered = true;
    if (std::atexit(&ShutdownHook::runInstalledHooks) != 0) {
      STFATAL << "Could not register the atexit handler";
    }
  }
}

void ShutdownHook::runInstalledHooks() {
  ShutdownHook* hook;
  {
    lock_guard<std::mutex> guard(installedMutex);
    hook = installed;
  }
  if (hook) {
    hook->runHooks();
  }
}
}  // namespace cm
