// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Sandsock, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace sandsock
{
namespace core
{

/// \brief Executes submitted tasks on worker threads.
///
/// Implementations apply their own queueing and backpressure; submit() may
/// throw when the executor is saturated or shut down.
class ITaskExecutor
{
public:
  virtual ~ITaskExecutor() = default;

  virtual void submit(std::function<void()> task) = 0;

  /// Stop accepting work and wait for in-flight tasks. Safe to call twice.
  virtual void shutdown() = 0;
};

/// \brief Periodic task scheduler (the run-loop).
class IScheduler
{
public:
  using JobId = std::uint64_t;

  virtual ~IScheduler() = default;

  /// Run \p task every \p interval until cancelled. Returns a non-zero id.
  virtual JobId scheduleEvery(std::chrono::milliseconds interval, std::function<void()> task) = 0;

  /// Returns false when \p id is unknown or already cancelled.
  virtual bool cancelSchedule(JobId id) = 0;
};

} // namespace core
} // namespace sandsock
