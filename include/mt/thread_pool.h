#pragma once

#include "mt/sleeper.h"

#include <concepts>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <latch>
#include <mutex>
#include <optional>
#include <thread>
#include <type_traits>
#include <vector>

// Fixed set of workers draining a FIFO queue. `func` returning false stops
// the whole pool. The destructor waits for every worker.
template <typename T>
  requires std::is_move_assignable_v<T> && std::is_move_constructible_v<T>
class thread_pool {
  const size_t n_threads = 1;
  std::vector<std::jthread> threads;
  std::latch latch;

  using Func = std::function<bool(T&&)>;
  const Func func;

  std::deque<T> vals;
  mutable std::mutex mtx;
  std::condition_variable cv;
  bool stopped = false;
  bool draining = false;

  std::optional<T> pop() {
    std::unique_lock lk{mtx};
    cv.wait(lk, [this] { return stopped || draining || !vals.empty(); });
    if (stopped || vals.empty())
      return std::nullopt;
    auto t = std::move(vals.front());
    vals.pop_front();
    return t;
  }

  void worker_loop() {
    while (!sleeper.should_shutdown()) {
      auto t_opt = pop();
      if (!t_opt)
        break;
      auto cont = func(std::move(*t_opt));
      if (!cont) {
        stop();
        break;
      }
    }
    latch.count_down();
  }

  void stop() {
    {
      std::lock_guard lk{mtx};
      stopped = true;
    }
    cv.notify_all();
  }

 public:
  thread_pool(size_t n_threads, Func func, std::vector<T> vec)
      : n_threads{n_threads ? n_threads : 1},
        latch{static_cast<ptrdiff_t>(this->n_threads)},
        func{std::move(func)},
        vals{std::make_move_iterator(vec.begin()),
             std::make_move_iterator(vec.end())}  //
  {
    threads.reserve(this->n_threads);
    for (size_t i = 0; i < this->n_threads; i++)
      threads.emplace_back(&thread_pool::worker_loop, this).detach();
  }

  // Lets the workers exit once the queue is empty
  ~thread_pool() {
    {
      std::lock_guard lk{mtx};
      draining = true;
    }
    cv.notify_all();
    latch.wait();
  }

  thread_pool(const thread_pool&) = delete;
  thread_pool& operator=(const thread_pool&) = delete;
  thread_pool(thread_pool&&) = delete;
  thread_pool& operator=(thread_pool&&) = delete;
};
