/// @file parallel.cpp
/// @brief Implementation of the fork/join parallel-for.

#include "util/parallel.h"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace chromaflow {

size_t parallel_worker_count(size_t count) {
  size_t hardware = std::max<size_t>(1, std::thread::hardware_concurrency());
  return std::min(count, hardware);
}

void parallel_for(size_t count, const std::function<void(size_t)>& body, bool parallel) {
  if (count == 0) {
    return;
  }

  size_t n_workers = parallel ? parallel_worker_count(count) : 1;
  if (n_workers <= 1) {
    for (size_t i = 0; i < count; ++i) {
      body(i);
    }
    return;
  }

  std::atomic<size_t> next{0};
  std::exception_ptr first_error;
  std::mutex error_mutex;

  auto worker = [&]() {
    for (size_t i = next.fetch_add(1); i < count; i = next.fetch_add(1)) {
      try {
        body(i);
      } catch (...) {
        std::lock_guard<std::mutex> lock(error_mutex);
        if (!first_error) {
          first_error = std::current_exception();
        }
      }
    }
  };

  // The calling thread works too, so spawn one fewer.
  std::vector<std::thread> threads;
  threads.reserve(n_workers - 1);
  for (size_t t = 1; t < n_workers; ++t) {
    threads.emplace_back(worker);
  }
  worker();

  for (auto& thread : threads) {
    thread.join();
  }

  if (first_error) {
    std::rethrow_exception(first_error);
  }
}

}  // namespace chromaflow
