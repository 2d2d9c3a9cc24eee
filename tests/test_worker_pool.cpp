#include <catch2/catch.hpp>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <pthread.h>
#include <string>
#include <thread>

#include "worker_pool.hpp"

namespace {
// Polls until pred holds or the timeout expires.
template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  return pred();
}
} // namespace

TEST_CASE("pool runs submitted jobs on its workers", "[pool]") {
  auto done = std::make_shared<std::atomic<int>>(0);
  WorkerPool pool(2, 4);

  for (int i = 0; i < 4; ++i) pool.submit([done] { (*done)++; });
  CHECK(eventually([&] { return *done == 4; }));
  CHECK(pool.workers() == 2);
  CHECK(pool.backlog_capacity() == 4);
}

TEST_CASE("pool rejects submissions past its backlog", "[pool]") {
  auto gate = std::make_shared<std::promise<void>>();
  auto release = gate->get_future().share();
  auto started = std::make_shared<std::atomic<bool>>(false);

  WorkerPool pool(1, 1);
  pool.submit([release, started] { *started = true; release.wait(); });
  REQUIRE(eventually([&] { return started->load(); }));

  // the only worker is busy: one job fits the backlog, the next does not
  pool.submit([] {});
  CHECK(pool.pending() == 1);
  CHECK_THROWS_AS(pool.submit([] {}), PoolRejected);

  gate->set_value();
  CHECK(eventually([&] { return pool.pending() == 0; }));
}

TEST_CASE("pool validates its sizing", "[pool]") {
  CHECK_THROWS_AS(WorkerPool(0, 1), std::invalid_argument);
  CHECK_THROWS_AS(WorkerPool(1, 0), std::invalid_argument);
}

TEST_CASE("destroying a pool does not wait for a busy worker", "[pool]") {
  auto gate = std::make_shared<std::promise<void>>();
  auto release = gate->get_future().share();
  auto started = std::make_shared<std::atomic<bool>>(false);

  auto begin = std::chrono::steady_clock::now();
  {
    WorkerPool pool(1, 1);
    pool.submit([release, started] { *started = true; release.wait(); });
    REQUIRE(eventually([&] { return started->load(); }));
  }
  CHECK(std::chrono::steady_clock::now() - begin < std::chrono::seconds(2));
  gate->set_value();
}

TEST_CASE("pool workers carry the collector thread name", "[pool]") {
  auto name = std::make_shared<std::promise<std::string>>();
  auto seen = name->get_future();
  WorkerPool pool(1, 1);

  pool.submit([name] {
    char buf[16] = {};
    pthread_getname_np(pthread_self(), buf, sizeof(buf));
    name->set_value(buf);
  });
  REQUIRE(seen.wait_for(std::chrono::seconds(2)) == std::future_status::ready);
  CHECK(seen.get() == WorkerPool::kThreadName);
}
