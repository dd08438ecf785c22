#include <verity/shutdown.hpp>

#include <chrono>
#include <condition_variable>

#include <trantor/utils/Logger.h>

namespace verity {

namespace {

// Only lock-free atomics are touched from signal context.
std::atomic<ShutdownHandler*> g_handler{nullptr};
std::atomic<int> g_signal{0};

std::mutex g_shutdown_mutex;
std::condition_variable g_shutdown_cv;

constexpr auto kWatchInterval = std::chrono::milliseconds(50);

}  // namespace

ShutdownHandler::ShutdownHandler() {
  ShutdownHandler* expected = nullptr;
  g_handler.compare_exchange_strong(expected, this);
}

ShutdownHandler::~ShutdownHandler() {
  RestoreSignalHandlers();
  Shutdown();

  ShutdownHandler* expected = this;
  g_handler.compare_exchange_strong(expected, nullptr);
}

void ShutdownHandler::SignalHandler(int signum) {
  g_signal.store(signum);
  ShutdownHandler* handler = g_handler.load();
  if (handler) handler->cancel_.store(true);
}

void ShutdownHandler::WatchSignals() {
  while (!stop_watcher_.load()) {
    const int signum = g_signal.exchange(0);
    if (signum != 0) {
      LOG_INFO << "received signal " << signum << ", shutting down";
      Shutdown();
      return;
    }
    std::this_thread::sleep_for(kWatchInterval);
  }
}

bool ShutdownHandler::InstallSignalHandlers() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (handlers_installed_) {
    return true;  // Already installed
  }

  struct sigaction sa;
  sa.sa_handler = SignalHandler;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = SA_RESTART;

  if (sigaction(SIGTERM, &sa, &old_sigterm_) != 0) {
    return false;
  }
  if (sigaction(SIGINT, &sa, &old_sigint_) != 0) {
    sigaction(SIGTERM, &old_sigterm_, nullptr);
    return false;
  }
  if (sigaction(SIGHUP, &sa, &old_sighup_) != 0) {
    sigaction(SIGTERM, &old_sigterm_, nullptr);
    sigaction(SIGINT, &old_sigint_, nullptr);
    return false;
  }

  stop_watcher_.store(false);
  watcher_ = std::thread([this] { WatchSignals(); });
  handlers_installed_ = true;
  return true;
}

void ShutdownHandler::RestoreSignalHandlers() {
  std::thread watcher;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!handlers_installed_) {
      return;
    }

    sigaction(SIGTERM, &old_sigterm_, nullptr);
    sigaction(SIGINT, &old_sigint_, nullptr);
    sigaction(SIGHUP, &old_sighup_, nullptr);
    handlers_installed_ = false;
    stop_watcher_.store(true);
    watcher = std::move(watcher_);
  }
  // The watcher may be inside Shutdown(), which takes mutex_.
  if (watcher.joinable() && watcher.get_id() != std::this_thread::get_id()) {
    watcher.join();
  } else if (watcher.joinable()) {
    watcher.detach();
  }
}

bool ShutdownHandler::Shutdown() {
  bool expected = false;
  if (!shutdown_requested_.compare_exchange_strong(expected, true)) {
    // Already shutting down, wait for completion
    WaitForShutdown();
    return false;
  }

  cancel_.store(true);

  std::vector<std::function<void()>> callbacks_copy;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks_copy = callbacks_;
  }
  for (const auto& callback : callbacks_copy) {
    if (callback) callback();
  }

  {
    std::lock_guard<std::mutex> lock(g_shutdown_mutex);
    shutdown_complete_.store(true);
  }
  g_shutdown_cv.notify_all();
  return true;
}

bool ShutdownHandler::IsShutdownRequested() const {
  return shutdown_requested_.load() || cancel_.load();
}

void ShutdownHandler::OnShutdown(std::function<void()> callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  callbacks_.push_back(std::move(callback));
}

void ShutdownHandler::WaitForShutdown() {
  std::unique_lock<std::mutex> lock(g_shutdown_mutex);
  g_shutdown_cv.wait(lock, [this] { return shutdown_complete_.load(); });
}

ShutdownHandler& GlobalShutdownHandler() {
  static ShutdownHandler instance;
  return instance;
}

}  // namespace verity
