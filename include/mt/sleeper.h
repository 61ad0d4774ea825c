#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <iostream>
#include <mutex>
#include <pthread.h>
#include <stdexcept>
#include <thread>

// Owns SIGINT/SIGTERM for the process and turns them into a shutdown flag
// that long waits can be interrupted by.
class Sleeper {
  std::atomic<bool> shutdown_requested{false};
  std::atomic<bool> exiting{false};
  std::mutex mtx;
  std::condition_variable cv;
  std::thread td;

  static sigset_t signal_set() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    return set;
  }

  void handler() {
    auto set = signal_set();

    int signum;
    while (!exiting.load(std::memory_order_acquire)) {
      if (sigwait(&set, &signum) != 0)
        continue;
      if (exiting.load(std::memory_order_acquire))
        break;
      if (signum == SIGINT || signum == SIGTERM) {
        std::cout << "\b \b" << "\b \b" << std::flush;
        request_shutdown();
        break;
      }
    }
  }

  void block_signals_for_all_threads() {
    auto set = signal_set();
    if (pthread_sigmask(SIG_BLOCK, &set, nullptr) != 0)
      throw std::runtime_error("Failed to block signals");
  }

 public:
  Sleeper() {
    block_signals_for_all_threads();
    td = std::thread(&Sleeper::handler, this);
  }

  ~Sleeper() {
    exiting.store(true, std::memory_order_release);
    request_shutdown();

    if (td.joinable()) {
      // wake the signal thread out of sigwait
      pthread_kill(td.native_handle(), SIGINT);
      td.join();
    }
  }

  Sleeper(const Sleeper&) = delete;
  Sleeper& operator=(const Sleeper&) = delete;
  Sleeper(Sleeper&&) = delete;
  Sleeper& operator=(Sleeper&&) = delete;

  bool should_shutdown() const {
    return shutdown_requested.load(std::memory_order_acquire);
  }

  void request_shutdown() {
    {
      std::lock_guard lk{mtx};
      shutdown_requested.store(true, std::memory_order_release);
    }
    cv.notify_all();
  }

  template <typename Rep, typename Period>
  bool sleep_for(const std::chrono::duration<Rep, Period> duration) {
    if (should_shutdown())
      return false;
    if (duration <= duration.zero())
      return true;
    std::unique_lock lk{mtx};
    return !cv.wait_for(lk, duration, [this] { return should_shutdown(); });
  }
};

inline Sleeper sleeper;
