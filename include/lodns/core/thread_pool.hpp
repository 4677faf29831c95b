// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of lodns, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <future>
#include <list>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

#include <lodns/core/logger.hpp>

namespace lodns
{
namespace core
{

/// A dynamic thread pool. Threads grow from initialSize up to maxSize while
/// tasks are waiting, and threads beyond initialSize exit after idleTimeout
/// without work. Exceptions escaping a task are passed to onTaskError.
class ThreadPool
{
public:
  /// Constructs the thread pool.
  ///
  /// @param initialSize   Minimum number of threads (always maintained).
  /// @param maxSize       Maximum number of threads.
  /// @param idleTimeout   Idle time after which surplus threads exit.
  /// @param maxQueueSize  Maximum number of queued tasks before enqueue throws.
  /// @param onTaskError   Optional handler for uncaught exceptions in tasks.
  ThreadPool(std::size_t initialSize = 2, std::size_t maxSize = 16,
             std::chrono::milliseconds idleTimeout = std::chrono::seconds(30),
             std::size_t maxQueueSize = 256,
             std::function<void(std::exception_ptr)> onTaskError = nullptr)
      : _initialSize(std::max<std::size_t>(initialSize, 1)),
        _maxSize(std::max(maxSize, std::max<std::size_t>(initialSize, 1))),
        _idleTimeout(idleTimeout), _maxQueueSize(maxQueueSize),
        _onTaskError(std::move(onTaskError))
  {
    std::lock_guard<std::mutex> lock(_mutex);
    for (std::size_t i = 0; i < _initialSize; ++i)
    {
      spawnWorkerLocked();
    }
  }

  ~ThreadPool() { shutdown(); }

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  /// Enqueue a fire-and-forget task.
  /// @throws std::runtime_error if the pool is shutting down or the queue is full
  template <typename F, typename... Args> void enqueue(F&& func, Args&&... args)
  {
    auto bound = std::bind(std::forward<F>(func), std::forward<Args>(args)...);
    switch (enqueueImpl([bound = std::move(bound)]() mutable { bound(); }))
    {
      case Admission::ShuttingDown:
        throw std::runtime_error("ThreadPool is shutting down");
      case Admission::QueueFull:
        throw std::runtime_error("ThreadPool task queue is full");
      case Admission::Accepted:
        break;
    }
  }

  /// Enqueue a fire-and-forget task; returns false instead of throwing.
  template <typename F> bool tryEnqueue(F&& func)
  {
    return enqueueImpl(std::function<void()>(std::forward<F>(func))) == Admission::Accepted;
  }

  /// Enqueue a task that returns a value and get a future for it.
  template <typename F, typename... Args>
  auto enqueueWithResult(F&& func, Args&&... args)
    -> std::future<std::invoke_result_t<F, Args...>>
  {
    using ResultType = std::invoke_result_t<F, Args...>;
    auto task = std::make_shared<std::packaged_task<ResultType()>>(
      std::bind(std::forward<F>(func), std::forward<Args>(args)...));
    auto future = task->get_future();
    if (enqueueImpl([task]() { (*task)(); }) != Admission::Accepted)
    {
      throw std::runtime_error("ThreadPool rejected task");
    }
    return future;
  }

  std::size_t getPendingTaskCount() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _tasks.size();
  }

  std::size_t getTotalThreadCount() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _liveThreads;
  }

  std::size_t getBusyThreadCount() const
  {
    std::lock_guard<std::mutex> lock(_mutex);
    return _busyThreads;
  }

  /// Stop accepting work, run the queued tasks to completion and join all
  /// threads. Safe to call more than once.
  void shutdown()
  {
    std::list<std::thread> threads;
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (_shutdown && _threads.empty())
      {
        return;
      }
      _shutdown = true;
      threads.swap(_threads);
    }
    _condition.notify_all();

    for (auto& t : threads)
    {
      if (t.joinable())
      {
        t.join();
      }
    }
    LODNS_LOG_DEBUG("ThreadPool: joined " << threads.size() << " worker threads");
  }

private:
  enum class Admission
  {
    Accepted,
    ShuttingDown,
    QueueFull
  };

  /// Admission is decided under _mutex.
  Admission enqueueImpl(std::function<void()> f)
  {
    {
      std::lock_guard<std::mutex> lock(_mutex);
      if (_shutdown)
      {
        return Admission::ShuttingDown;
      }
      if (_tasks.size() >= _maxQueueSize)
      {
        return Admission::QueueFull;
      }
      _tasks.push(std::move(f));

      if (_busyThreads + _tasks.size() > _liveThreads && _liveThreads < _maxSize)
      {
        spawnWorkerLocked();
      }
    }
    _condition.notify_one();
    return Admission::Accepted;
  }

  /// \note Caller holds _mutex.
  void spawnWorkerLocked()
  {
    reapExitedLocked();
    ++_liveThreads;
    _threads.emplace_back([this]() { workerLoop(); });
  }

  /// Joins threads that left workerLoop after an idle timeout.
  /// \note Caller holds _mutex.
  void reapExitedLocked()
  {
    for (auto id : _exited)
    {
      auto it = std::find_if(_threads.begin(), _threads.end(),
                             [id](const std::thread& t) { return t.get_id() == id; });
      if (it != _threads.end())
      {
        it->join();
        _threads.erase(it);
      }
    }
    _exited.clear();
  }

  void workerLoop()
  {
    while (true)
    {
      std::function<void()> task;
      {
        std::unique_lock<std::mutex> lock(_mutex);
        bool ready =
          _condition.wait_for(lock, _idleTimeout, [this]() { return _shutdown || !_tasks.empty(); });

        if (!ready && _liveThreads > _initialSize)
        {
          --_liveThreads;
          _exited.push_back(std::this_thread::get_id());
          return;
        }
        if (_tasks.empty())
        {
          if (_shutdown)
          {
            --_liveThreads;
            return;
          }
          continue;
        }

        task = std::move(_tasks.front());
        _tasks.pop();
        ++_busyThreads;
      }

      runTask(task);

      std::lock_guard<std::mutex> lock(_mutex);
      --_busyThreads;
    }
  }

  void runTask(std::function<void()>& task)
  {
    try
    {
      task();
    }
    catch (...)
    {
      if (_onTaskError)
      {
        _onTaskError(std::current_exception());
      }
      else
      {
        LODNS_LOG_ERROR("ThreadPool: unhandled exception in task");
      }
    }
  }

  const std::size_t _initialSize;
  const std::size_t _maxSize;
  const std::chrono::milliseconds _idleTimeout;
  const std::size_t _maxQueueSize;
  const std::function<void(std::exception_ptr)> _onTaskError;

  mutable std::mutex _mutex;
  std::condition_variable _condition;
  std::queue<std::function<void()>> _tasks;
  std::list<std::thread> _threads;
  std::vector<std::thread::id> _exited;
  std::size_t _liveThreads{0};
  std::size_t _busyThreads{0};
  bool _shutdown{false};
};

} // namespace core
} // namespace lodns
