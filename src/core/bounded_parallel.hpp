#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <functional>
#include <thread>
#include <vector>

namespace comfytest::core {

// Calls `fn(i)` for every i in [0, count) on at most `limit` threads.
// Items are handed out through a shared counter; `fn` must only touch state
// owned by its own index.
inline void ForEachBounded(std::size_t count, std::size_t limit,
                           const std::function<void(std::size_t)>& fn) {
  if (count == 0U) {
    return;
  }
  const std::size_t workers = std::clamp<std::size_t>(limit, 1U, count);
  if (workers == 1U) {
    for (std::size_t i = 0; i < count; ++i) {
      fn(i);
    }
    return;
  }

  std::atomic<std::size_t> next{0};
  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (std::size_t w = 0; w < workers; ++w) {
    threads.emplace_back([&]() {
      for (std::size_t i = next.fetch_add(1U); i < count; i = next.fetch_add(1U)) {
        fn(i);
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }
}

} // namespace comfytest::core
