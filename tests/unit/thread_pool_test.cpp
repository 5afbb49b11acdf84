#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <future>
#include <stdexcept>
#include <vector>

#include "calibet/core/thread_pool.hpp"

using calibet::core::ThreadPool;

TEST_CASE("thread pool runs every task", "[thread_pool]") {
  ThreadPool pool(4);

  std::vector<std::future<int>> futures;
  for (int i = 0; i < 100; ++i) {
    futures.push_back(pool.submit([i] { return i * i; }));
  }
  long total = 0;
  for (auto& f : futures) total += f.get();
  REQUIRE(total == 328350);
}

TEST_CASE("thread pool forwards exceptions through the future", "[thread_pool]") {
  ThreadPool pool(2);
  auto failing = pool.submit([]() -> int { throw std::runtime_error("boom"); });
  REQUIRE_THROWS_AS(failing.get(), std::runtime_error);

  auto ok = pool.submit([] { return 7; });
  REQUIRE(ok.get() == 7);
}

TEST_CASE("thread pool destructor drains queued work", "[thread_pool]") {
  std::atomic<int> counter{0};
  {
    ThreadPool pool(1);
    for (int i = 0; i < 50; ++i) {
      (void)pool.submit([&counter] { counter.fetch_add(1); });
    }
  }
  REQUIRE(counter.load() == 50);
}
