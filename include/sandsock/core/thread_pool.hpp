// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Sandsock, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <unordered_map>
#include <vector>

#include <sandsock/core/logger.hpp>
#include <sandsock/core/task_executor.hpp>

namespace sandsock
{
namespace core
{

/// A dynamic thread pool. Threads grow up to maxSize under load and idle
/// threads above initialSize exit after idleTimeout. Exceptions escaping a
/// task go to the onTaskError handler, or to the log when none is set.
///
/// Workers share the queue and counters through a reference-counted state,
/// so a task may shut down and release the last reference to its own pool.
class ThreadPool : public ITaskExecutor
{
public:
  /// @param initialSize   Threads kept alive at all times.
  /// @param maxSize       Hard limit on worker threads.
  /// @param idleTimeout   Idle time after which surplus threads exit.
  /// @param maxQueueSize  Pending tasks allowed before enqueue throws.
  /// @param onTaskError   Optional handler for exceptions escaping tasks.
  ThreadPool(std::size_t initialSize = std::thread::hardware_concurrency(),
             std::size_t maxSize = std::thread::hardware_concurrency() * 4,
             std::chrono::milliseconds idleTimeout = std::chrono::seconds(30),
             std::size_t maxQueueSize = 1024,
             std::function<void(std::exception_ptr)> onTaskError = nullptr)
      : _state(std::make_shared<State>(initialSize, maxSize < initialSize ? initialSize : maxSize,
                                       idleTimeout, maxQueueSize, std::move(onTaskError)))
  {
    for (std::size_t i = 0; i < initialSize; ++i)
    {
      spawnWorker(_state);
    }
  }

  ~ThreadPool() override { shutdown(); }

  ThreadPool(const ThreadPool &) = delete;
  ThreadPool &operator=(const ThreadPool &) = delete;
  ThreadPool(ThreadPool &&) = delete;
  ThreadPool &operator=(ThreadPool &&) = delete;

  /// Enqueue a fire-and-forget task. Throws std::runtime_error when the
  /// queue is full or the pool is shutting down.
  template <typename F, typename... Args> void enqueue(F &&func, Args &&...args)
  {
    enqueueImpl(guard(std::bind(std::forward<F>(func), std::forward<Args>(args)...)));
  }

  /// Enqueue a task and get a future for its result.
  template <typename F, typename... Args>
  auto enqueueWithResult(F &&func, Args &&...args) -> std::future<std::invoke_result_t<F, Args...>>
  {
    using ResultType = std::invoke_result_t<F, Args...>;
    auto task = std::make_shared<std::packaged_task<ResultType()>>(
      std::bind(std::forward<F>(func), std::forward<Args>(args)...));
    auto future = task->get_future();
    enqueueImpl([task]() { (*task)(); });
    return future;
  }

  /// Like enqueue(), but returns false instead of throwing.
  template <typename F, typename... Args> bool tryEnqueue(F &&func, Args &&...args)
  {
    return tryEnqueueImpl(guard(std::bind(std::forward<F>(func), std::forward<Args>(args)...)));
  }

  void submit(std::function<void()> task) override { enqueue(std::move(task)); }

  /// Stop accepting tasks, let queued tasks finish, and join every worker.
  /// Called from one of the pool's own tasks, that worker is detached and
  /// leaves once the task returns.
  void shutdown() override
  {
    State &state = *_state;
    {
      std::lock_guard<std::mutex> lock(state.mutex);
      if (state.shutdown)
      {
        return;
      }
      state.shutdown = true;
    }
    state.condition.notify_all();
    SANDSOCK_LOG_DEBUG("ThreadPool::shutdown() - waiting for workers");

    int joined = 0;
    while (true)
    {
      std::thread worker;
      {
        std::lock_guard<std::mutex> lock(state.mutex);
        auto it = state.threads.begin();
        while (it != state.threads.end() && !it->second.joinable())
        {
          ++it;
        }
        if (it == state.threads.end())
        {
          break;
        }
        worker = std::move(it->second);
        state.threads.erase(it);
      }

      if (worker.get_id() == std::this_thread::get_id())
      {
        worker.detach();
        continue;
      }
      worker.join();
      ++joined;
    }

    SANDSOCK_LOG_DEBUG("ThreadPool::shutdown() - " << joined << " workers joined");
  }

  bool isShutdown() const
  {
    std::lock_guard<std::mutex> lock(_state->mutex);
    return _state->shutdown;
  }

  std::size_t getPendingTaskCount() const
  {
    std::lock_guard<std::mutex> lock(_state->mutex);
    return _state->tasks.size();
  }

  std::size_t getActiveThreadCount() const { return _state->activeThreads.load(); }

  std::size_t getTotalThreadCount() const
  {
    std::lock_guard<std::mutex> lock(_state->mutex);
    return _state->threads.size() - _state->retiredIds.size();
  }

private:
  struct State
  {
    State(std::size_t initial, std::size_t max, std::chrono::milliseconds idle,
          std::size_t maxQueue, std::function<void(std::exception_ptr)> onError)
        : initialSize(initial), maxSize(max), idleTimeout(idle), maxQueueSize(maxQueue),
          onTaskError(std::move(onError))
    {
    }

    void reportTaskError(std::exception_ptr error) const
    {
      if (onTaskError)
      {
        onTaskError(error);
        return;
      }

      try
      {
        std::rethrow_exception(error);
      }
      catch (const std::exception &e)
      {
        SANDSOCK_LOG_ERROR("ThreadPool: unhandled exception in task: " << e.what());
      }
      catch (...)
      {
        SANDSOCK_LOG_ERROR("ThreadPool: unhandled non-standard exception in task");
      }
    }

    std::unordered_map<std::thread::id, std::thread> threads;
    std::queue<std::function<void()>> tasks;
    mutable std::mutex mutex;
    std::condition_variable condition;

    const std::size_t initialSize;
    const std::size_t maxSize;
    const std::chrono::milliseconds idleTimeout;
    const std::size_t maxQueueSize;

    bool shutdown{false};
    std::size_t busyThreads{0};
    std::vector<std::thread::id> retiredIds;
    std::atomic<std::size_t> activeThreads{0};

    const std::function<void(std::exception_ptr)> onTaskError;
  };

  template <typename Bound> std::function<void()> guard(Bound bound)
  {
    std::weak_ptr<State> weak = _state;
    return [bound = std::move(bound), weak]() mutable
    {
      try
      {
        bound();
      }
      catch (...)
      {
        if (auto state = weak.lock())
        {
          state->reportTaskError(std::current_exception());
        }
      }
    };
  }

  void enqueueImpl(std::function<void()> f)
  {
    if (!tryEnqueueImpl(std::move(f)))
    {
      std::lock_guard<std::mutex> lock(_state->mutex);
      throw std::runtime_error(_state->shutdown ? "ThreadPool is shutting down"
                                                : "ThreadPool task queue is full");
    }
  }

  bool tryEnqueueImpl(std::function<void()> f)
  {
    State &state = *_state;
    bool shouldSpawn = false;
    {
      std::lock_guard<std::mutex> lock(state.mutex);
      if (state.shutdown || state.tasks.size() >= state.maxQueueSize)
      {
        return false;
      }

      state.tasks.emplace(std::move(f));
      std::size_t live = state.threads.size() - state.retiredIds.size();
      shouldSpawn = state.busyThreads + state.tasks.size() > live && live < state.maxSize;
    }

    if (shouldSpawn)
    {
      spawnWorker(_state);
    }
    state.condition.notify_one();
    return true;
  }

  static void spawnWorker(const std::shared_ptr<State> &state)
  {
    std::vector<std::thread> retired;
    {
      std::lock_guard<std::mutex> lock(state->mutex);
      if (state->shutdown)
      {
        return;
      }

      for (const auto &id : state->retiredIds)
      {
        auto it = state->threads.find(id);
        if (it != state->threads.end())
        {
          retired.push_back(std::move(it->second));
          state->threads.erase(it);
        }
      }
      state->retiredIds.clear();

      std::thread t([state]() { workerLoop(*state); });
      state->threads.emplace(t.get_id(), std::move(t));
    }

    // Retired workers have left their loop; joining them is quick.
    for (auto &t : retired)
    {
      t.join();
    }
  }

  static void workerLoop(State &state)
  {
    while (true)
    {
      std::function<void()> task;
      {
        std::unique_lock<std::mutex> lock(state.mutex);
        bool ready = state.condition.wait_for(lock, state.idleTimeout, [&state]()
                                              { return state.shutdown || !state.tasks.empty(); });

        if (!ready)
        {
          if (state.threads.size() - state.retiredIds.size() > state.initialSize)
          {
            state.retiredIds.push_back(std::this_thread::get_id());
            return;
          }
          continue;
        }

        if (state.tasks.empty())
        {
          // Only reachable once shutdown was signalled and the queue drained.
          return;
        }

        task = std::move(state.tasks.front());
        state.tasks.pop();
        ++state.busyThreads;
      }

      ++state.activeThreads;
      try
      {
        task();
      }
      catch (...)
      {
        state.reportTaskError(std::current_exception());
      }
      // May destroy the ThreadPool itself; only the shared state is used below.
      task = nullptr;
      --state.activeThreads;

      std::lock_guard<std::mutex> lock(state.mutex);
      --state.busyThreads;
    }
  }

  std::shared_ptr<State> _state;
};

} // namespace core
} // namespace sandsock
