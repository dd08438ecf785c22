#pragma once

#include <atomic>
#include <csignal>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace verity {

/**
 * ShutdownHandler turns SIGTERM/SIGINT/SIGHUP into a cooperative shutdown.
 *
 * The signal handler itself only raises flags. A watcher thread notices them
 * and calls Shutdown(), which:
 *   1. sets the cancel flag returned by CancelFlag(), so bulk detector calls
 *      running under a RunControl built from it return Aborted
 *   2. runs the OnShutdown() callbacks in registration order
 *
 * Example:
 *   verity::ShutdownHandler& shutdown = verity::GlobalShutdownHandler();
 *   shutdown.InstallSignalHandlers();
 *   auto ctl = verity::RunControl::WithTimeout(timeout, shutdown.CancelFlag());
 *   detector->BatchDetectDuplicates(nullptr, &matches, ctl);
 */
class ShutdownHandler {
 public:
  ShutdownHandler();
  ~ShutdownHandler();

  ShutdownHandler(const ShutdownHandler&) = delete;
  ShutdownHandler& operator=(const ShutdownHandler&) = delete;

  /**
   * Install handlers for SIGTERM, SIGINT and SIGHUP and start the watcher.
   * Returns true if handlers were installed successfully.
   *
   * Note: This modifies global signal handlers. Only call once per process.
   */
  bool InstallSignalHandlers();

  /** Restore original signal handlers and stop the watcher. */
  void RestoreSignalHandlers();

  /**
   * Trigger shutdown. Thread-safe and idempotent.
   * Returns true if this call performed it, false if already shut down.
   */
  bool Shutdown();

  bool IsShutdownRequested() const;

  /** Set once shutdown starts. Valid for the handler's lifetime. */
  const std::atomic<bool>* CancelFlag() const { return &cancel_; }

  /** Run `callback` during shutdown. */
  void OnShutdown(std::function<void()> callback);

  /** Block until Shutdown() has completed. */
  void WaitForShutdown();

 private:
  static void SignalHandler(int signum);
  void WatchSignals();

  std::mutex mutex_;
  std::vector<std::function<void()>> callbacks_;
  std::atomic<bool> cancel_{false};
  std::atomic<bool> shutdown_requested_{false};
  std::atomic<bool> shutdown_complete_{false};

  bool handlers_installed_ = false;
  std::atomic<bool> stop_watcher_{false};
  std::thread watcher_;

  // Original signal handlers to restore
  struct sigaction old_sigterm_;
  struct sigaction old_sigint_;
  struct sigaction old_sighup_;
};

/**
 * Global shutdown handler instance.
 * Use this for simple single-instance deployments.
 */
ShutdownHandler& GlobalShutdownHandler();

}  // namespace verity
