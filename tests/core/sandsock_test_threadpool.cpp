// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Sandsock, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#define CATCH_CONFIG_MAIN
#include "test_helpers.hpp"
#include <catch2/catch.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>

using sandsock::core::ThreadPool;

TEST_CASE("ThreadPool runs enqueued tasks", "[threadpool][basic]")
{
  sandsock::test::initializeTestLogging();
  ThreadPool pool(2, 4, std::chrono::seconds(1), 64);
  std::atomic<int> count{0};

  for (int i = 0; i < 20; ++i)
  {
    pool.enqueue([&count]() { ++count; });
  }
  pool.shutdown();

  CHECK(count.load() == 20);
  CHECK(pool.isShutdown());
}

TEST_CASE("ThreadPool returns results through futures", "[threadpool][future]")
{
  ThreadPool pool(1, 2);
  auto sum = pool.enqueueWithResult([](int a, int b) { return a + b; }, 40, 2);
  CHECK(sum.get() == 42);

  auto failing = pool.enqueueWithResult([]() -> int { throw std::runtime_error("boom"); });
  CHECK_THROWS_AS(failing.get(), std::runtime_error);
}

TEST_CASE("ThreadPool applies queue backpressure", "[threadpool][backpressure]")
{
  ThreadPool pool(1, 1, std::chrono::seconds(1), 1);

  std::mutex mutex;
  std::condition_variable cv;
  bool release = false;
  std::promise<void> started;

  pool.enqueue(
    [&]()
    {
      started.set_value();
      std::unique_lock<std::mutex> lock(mutex);
      cv.wait(lock, [&]() { return release; });
    });
  started.get_future().wait();

  pool.enqueue([]() {});
  CHECK(pool.getPendingTaskCount() == 1);
  CHECK_FALSE(pool.tryEnqueue([]() {}));
  CHECK_THROWS_WITH(pool.enqueue([]() {}), "ThreadPool task queue is full");
  CHECK_THROWS_AS(pool.submit([]() {}), std::runtime_error);

  {
    std::lock_guard<std::mutex> lock(mutex);
    release = true;
  }
  cv.notify_all();
  pool.shutdown();
}

TEST_CASE("ThreadPool rejects work after shutdown", "[threadpool][shutdown]")
{
  ThreadPool pool(1, 1);
  pool.shutdown();
  pool.shutdown();

  CHECK_THROWS_WITH(pool.enqueue([]() {}), "ThreadPool is shutting down");
  CHECK_FALSE(pool.tryEnqueue([]() {}));
}

TEST_CASE("A task may shut down and release its own pool", "[threadpool][shutdown]")
{
  auto pool = std::make_shared<ThreadPool>(1, 1, std::chrono::seconds(1), 8);
  auto holder = std::make_shared<std::shared_ptr<ThreadPool>>(pool);
  auto go = std::make_shared<std::promise<void>>();
  auto released = std::make_shared<std::promise<void>>();
  auto drained = std::make_shared<std::promise<void>>();
  auto goFuture = go->get_future().share();

  pool->submit(
    [holder, goFuture, released]()
    {
      goFuture.wait();
      (*holder)->shutdown();
      holder->reset();
      released->set_value();
    });
  pool->submit([drained]() { drained->set_value(); });
  pool.reset();
  go->set_value();

  auto releasedFuture = released->get_future();
  auto drainedFuture = drained->get_future();
  REQUIRE(releasedFuture.wait_for(std::chrono::seconds(2)) == std::future_status::ready);
  // The detached worker still drains what was queued before the shutdown.
  REQUIRE(drainedFuture.wait_for(std::chrono::seconds(2)) == std::future_status::ready);
  CHECK_FALSE(*holder);
}

TEST_CASE("ThreadPool reports escaping exceptions", "[threadpool][errors]")
{
  std::promise<std::string> reported;
  {
    ThreadPool pool(1, 1, std::chrono::seconds(1), 8,
                    [&reported](std::exception_ptr error)
                    {
                      try
                      {
                        std::rethrow_exception(error);
                      }
                      catch (const std::exception &e)
                      {
                        reported.set_value(e.what());
                      }
                    });
    pool.enqueue([]() { throw std::runtime_error("task failed"); });
    auto future = reported.get_future();
    REQUIRE(future.wait_for(std::chrono::seconds(2)) == std::future_status::ready);
    CHECK(future.get() == "task failed");
  }

  sandsock::test::LogCapture logs;
  {
    ThreadPool pool(1, 1);
    pool.enqueue([]() { throw std::runtime_error("unhandled"); });
  }
  CHECK(logs.contains("unhandled exception in task: unhandled"));
}

TEST_CASE("ThreadPool grows under load and shrinks when idle", "[threadpool][scaling]")
{
  ThreadPool pool(1, 4, std::chrono::milliseconds(100), 64);
  CHECK(pool.getTotalThreadCount() == 1);

  std::atomic<int> running{0};
  std::atomic<bool> release{false};
  for (int i = 0; i < 4; ++i)
  {
    pool.enqueue(
      [&]()
      {
        ++running;
        while (!release.load())
        {
          std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
      });
  }

  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
  while (running.load() < 4 && std::chrono::steady_clock::now() < deadline)
  {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  CHECK(running.load() == 4);
  CHECK(pool.getTotalThreadCount() == 4);

  release = true;
  deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
  while (pool.getTotalThreadCount() > 1 && std::chrono::steady_clock::now() < deadline)
  {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
  CHECK(pool.getTotalThreadCount() == 1);
  pool.shutdown();
}
