#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace kisancpp::core {

inline constexpr std::size_t kDefaultReadConcurrency = 4;

// Runs fn(i) for i in [0, count) on up to `max_workers` threads. The first
// exception stops the remaining work and is rethrown on the calling thread.
template <typename Fn>
void ParallelFor(std::size_t count, std::size_t max_workers, Fn&& fn) {
  const std::size_t worker_count = std::min(count, std::max<std::size_t>(max_workers, 1));
  if (worker_count <= 1) {
    for (std::size_t i = 0; i < count; ++i) {
      fn(i);
    }
    return;
  }

  std::atomic<std::size_t> next_index{0};
  std::atomic<bool> stop_workers{false};
  std::exception_ptr first_error{};
  std::mutex error_mutex{};

  auto worker = [&]() {
    while (true) {
      if (stop_workers.load(std::memory_order_acquire)) {
        return;
      }
      const auto index = next_index.fetch_add(1);
      if (index >= count) {
        return;
      }
      try {
        fn(index);
      } catch (...) {
        std::lock_guard<std::mutex> error_lock(error_mutex);
        if (first_error == nullptr) {
          first_error = std::current_exception();
        }
        stop_workers.store(true, std::memory_order_release);
        return;
      }
    }
  };

  std::vector<std::thread> workers{};
  workers.reserve(worker_count);
  for (std::size_t i = 0; i < worker_count; ++i) {
    workers.emplace_back(worker);
  }
  for (auto& thread : workers) {
    thread.join();
  }
  if (first_error != nullptr) {
    std::rethrow_exception(first_error);
  }
}

}  // namespace kisancpp::core
