// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Sandsock, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once
#ifndef __linux__
#error "Linux-only (epoll/eventfd/timerfd)"
#endif

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include <pthread.h>
#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <sys/timerfd.h>
#include <unistd.h>

#include <sandsock/core/logger.hpp>
#include <sandsock/core/task_executor.hpp>

namespace sandsock
{
namespace core
{

enum class RunLoopError
{
  None = 0,
  SystemError,
  InvalidInterval,
  ServiceStopped
};

class RunLoopException : public std::exception
{
public:
  RunLoopException(RunLoopError code, const std::string &msg, int errnoVal = 0)
      : _code(code), _errno(errnoVal),
        _message(errnoVal != 0 ? msg + ": " + std::strerror(errnoVal) : msg)
  {
  }

  RunLoopError code() const { return _code; }
  int getErrno() const { return _errno; }
  const char *what() const noexcept override { return _message.c_str(); }

private:
  RunLoopError _code;
  int _errno;
  std::string _message;
};

struct RunLoopConfig
{
  int maxEpollEvents{16};
  std::size_t initialHeapCapacity{64};
  std::string threadName{"sandsock-loop"};
};

/// \brief Single-threaded scheduler built on epoll, timerfd and eventfd.
///
/// Due tasks run one at a time on the loop thread, in due-time order. A task
/// that throws is logged and, if periodic, keeps its schedule.
class RunLoop : public IScheduler
{
public:
  using Clock = std::chrono::steady_clock;
  using TimePoint = Clock::time_point;
  using Duration = Clock::duration;
  using Task = std::function<void()>;

  explicit RunLoop(const RunLoopConfig &config = {}) : _config(config)
  {
    _heap.reserve(_config.initialHeapCapacity);
  }

  ~RunLoop() override { stop(); }

  RunLoop(const RunLoop &) = delete;
  RunLoop &operator=(const RunLoop &) = delete;

  /// Create the kernel objects and start the loop thread.
  void start()
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_running.load(std::memory_order_acquire))
    {
      return;
    }

    _epollFd = ::epoll_create1(EPOLL_CLOEXEC);
    if (_epollFd < 0)
    {
      throw RunLoopException(RunLoopError::SystemError, "epoll_create1 failed", errno);
    }

    _timerFd = ::timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    _eventFd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (_timerFd < 0 || _eventFd < 0)
    {
      int err = errno;
      closeFds();
      throw RunLoopException(RunLoopError::SystemError, "timerfd/eventfd create failed", err);
    }

    try
    {
      addEpollFd(_timerFd);
      addEpollFd(_eventFd);
    }
    catch (const RunLoopException &)
    {
      closeFds();
      throw;
    }

    _running.store(true, std::memory_order_release);
    _thread = std::thread([this]() { runLoop(); });
    if (!_config.threadName.empty())
    {
      ::pthread_setname_np(_thread.native_handle(), _config.threadName.substr(0, 15).c_str());
    }
    SANDSOCK_LOG_DEBUG("RunLoop started");
  }

  /// Stop the loop and join its thread. Pending tasks are dropped.
  void stop()
  {
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (!_running.exchange(false, std::memory_order_acq_rel))
      {
        return;
      }
      poke();
    }

    if (_thread.joinable())
    {
      if (_thread.get_id() == std::this_thread::get_id())
      {
        _thread.detach();
      }
      else
      {
        _thread.join();
      }
    }

    std::lock_guard<std::mutex> lock(_mutex);
    closeFds();
    _records.clear();
    _heap.clear();
    SANDSOCK_LOG_DEBUG("RunLoop stopped");
  }

  bool isRunning() const { return _running.load(std::memory_order_acquire); }

  /// Run \p task once at \p tp.
  JobId scheduleAt(TimePoint tp, Task task) { return addRecord(tp, Duration::zero(), std::move(task)); }

  /// Run \p task once after \p d.
  JobId scheduleAfter(Duration d, Task task)
  {
    return addRecord(Clock::now() + d, Duration::zero(), std::move(task));
  }

  JobId scheduleEvery(std::chrono::milliseconds interval, std::function<void()> task) override
  {
    if (interval <= std::chrono::milliseconds::zero())
    {
      throw RunLoopException(RunLoopError::InvalidInterval, "Periodic interval must be positive");
    }
    return addRecord(Clock::now() + interval, interval, std::move(task));
  }

  /// Cancel a task. A periodic task currently executing finishes that run
  /// and is not re-armed.
  bool cancel(JobId id)
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _records.erase(id) > 0;
  }

  bool cancelSchedule(JobId id) override { return cancel(id); }

  std::size_t size() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _records.size();
  }

private:
  struct Record
  {
    std::shared_ptr<Task> task;
    Duration interval;
    TimePoint due;
  };

  struct HeapItem
  {
    TimePoint tp;
    JobId id;
  };

  struct DueTask
  {
    JobId id;
    std::shared_ptr<Task> task;
    bool periodic;
  };

  static bool less(const HeapItem &a, const HeapItem &b)
  {
    return a.tp < b.tp || (a.tp == b.tp && a.id < b.id);
  }

  JobId addRecord(TimePoint tp, Duration interval, Task task)
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (!_running.load(std::memory_order_acquire))
    {
      throw RunLoopException(RunLoopError::ServiceStopped, "RunLoop is not running");
    }

    JobId id = ++_nextId;
    _records.emplace(id, Record{std::make_shared<Task>(std::move(task)), interval, tp});
    pushHeap(HeapItem{tp, id});
    poke();
    return id;
  }

  void pushHeap(HeapItem item)
  {
    _heap.push_back(item);
    std::size_t idx = _heap.size() - 1;
    while (idx > 0)
    {
      std::size_t parent = (idx - 1) / 2;
      if (!less(_heap[idx], _heap[parent]))
      {
        break;
      }
      std::swap(_heap[idx], _heap[parent]);
      idx = parent;
    }
  }

  void popHeap()
  {
    std::swap(_heap.front(), _heap.back());
    _heap.pop_back();

    std::size_t idx = 0;
    for (;;)
    {
      std::size_t left = idx * 2 + 1;
      std::size_t right = left + 1;
      std::size_t smallest = idx;
      if (left < _heap.size() && less(_heap[left], _heap[smallest]))
      {
        smallest = left;
      }
      if (right < _heap.size() && less(_heap[right], _heap[smallest]))
      {
        smallest = right;
      }
      if (smallest == idx)
      {
        break;
      }
      std::swap(_heap[idx], _heap[smallest]);
      idx = smallest;
    }
  }

  // Heap entries of cancelled or re-armed records are stale and skipped.
  void collectDueLocked(TimePoint now, std::vector<DueTask> &out)
  {
    while (!_heap.empty() && _heap.front().tp <= now)
    {
      HeapItem top = _heap.front();
      popHeap();

      auto it = _records.find(top.id);
      if (it == _records.end() || it->second.due != top.tp)
      {
        continue;
      }

      bool periodic = it->second.interval > Duration::zero();
      out.push_back(DueTask{top.id, it->second.task, periodic});
      if (periodic)
      {
        it->second.due = now + it->second.interval;
        pushHeap(HeapItem{it->second.due, top.id});
      }
      else
      {
        _records.erase(it);
      }
    }
  }

  void armTimerLocked()
  {
    itimerspec its{};
    while (!_heap.empty() && !isLiveLocked(_heap.front()))
    {
      popHeap();
    }

    if (!_heap.empty())
    {
      auto delta = _heap.front().tp - Clock::now();
      auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(delta).count();
      if (ns <= 0)
      {
        ns = 1;
      }
      its.it_value.tv_sec = static_cast<time_t>(ns / 1000000000LL);
      its.it_value.tv_nsec = static_cast<long>(ns % 1000000000LL);
    }

    if (::timerfd_settime(_timerFd, 0, &its, nullptr) != 0)
    {
      SANDSOCK_LOG_ERROR("RunLoop: timerfd_settime failed: " << std::strerror(errno));
    }
  }

  bool isLiveLocked(const HeapItem &item) const
  {
    auto it = _records.find(item.id);
    return it != _records.end() && it->second.due == item.tp;
  }

  void poke()
  {
    std::uint64_t one = 1;
    if (_eventFd >= 0 && ::write(_eventFd, &one, sizeof(one)) < 0 && errno != EAGAIN)
    {
      SANDSOCK_LOG_ERROR("RunLoop: eventfd write failed: " << std::strerror(errno));
    }
  }

  void drainFd(int fd)
  {
    std::uint64_t val = 0;
    while (::read(fd, &val, sizeof(val)) == static_cast<ssize_t>(sizeof(val)))
    {
    }
  }

  void addEpollFd(int fd)
  {
    epoll_event ev{};
    ev.events = EPOLLIN;
    ev.data.fd = fd;
    if (::epoll_ctl(_epollFd, EPOLL_CTL_ADD, fd, &ev) != 0)
    {
      throw RunLoopException(RunLoopError::SystemError, "epoll_ctl(ADD) failed", errno);
    }
  }

  void closeFds()
  {
    for (int *fd : {&_eventFd, &_timerFd, &_epollFd})
    {
      if (*fd >= 0)
      {
        ::close(*fd);
        *fd = -1;
      }
    }
  }

  void safeRun(const DueTask &due)
  {
    if (due.periodic)
    {
      // Cancelled between collection and execution.
      std::lock_guard<std::mutex> lock(_mutex);
      if (_records.find(due.id) == _records.end())
      {
        return;
      }
    }

    try
    {
      (*due.task)();
    }
    catch (const std::exception &e)
    {
      SANDSOCK_LOG_ERROR("RunLoop: task " << due.id << " threw: " << e.what());
    }
    catch (...)
    {
      SANDSOCK_LOG_ERROR("RunLoop: task " << due.id << " threw a non-standard exception");
    }
  }

  void runLoop()
  {
    std::vector<epoll_event> events(static_cast<std::size_t>(_config.maxEpollEvents));
    std::vector<DueTask> ready;

    while (_running.load(std::memory_order_acquire))
    {
      {
        std::lock_guard<std::mutex> lock(_mutex);
        armTimerLocked();
      }

      int rc = ::epoll_wait(_epollFd, events.data(), _config.maxEpollEvents, -1);
      if (rc < 0)
      {
        if (errno == EINTR)
        {
          continue;
        }
        SANDSOCK_LOG_ERROR("RunLoop: epoll_wait failed: " << std::strerror(errno));
        break;
      }

      for (int i = 0; i < rc; ++i)
      {
        drainFd(events[i].data.fd);
      }

      if (!_running.load(std::memory_order_acquire))
      {
        break;
      }

      {
        std::lock_guard<std::mutex> lock(_mutex);
        collectDueLocked(Clock::now(), ready);
      }

      for (const auto &due : ready)
      {
        if (!_running.load(std::memory_order_acquire))
        {
          break;
        }
        safeRun(due);
      }
      ready.clear();
    }
  }

  RunLoopConfig _config;

  mutable std::mutex _mutex;
  std::unordered_map<JobId, Record> _records;
  std::vector<HeapItem> _heap;
  JobId _nextId{0};

  std::atomic<bool> _running{false};
  std::thread _thread;
  int _epollFd{-1};
  int _timerFd{-1};
  int _eventFd{-1};
};

} // namespace core
} // namespace sandsock
