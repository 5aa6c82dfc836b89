#pragma once

#include "IParallelExecutor.h"
#include <cstddef>
#include <future>
#include <thread>
#include <vector>
#include <functional>
#include <memory>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <stdexcept>
#include <exception>

/**
 * @file ParallelExecutors.h
 * @brief Executor policies for running validation work.
 *
 *  - SingleThreadExecutor: runs tasks inline on the calling thread. Deterministic;
 *    used by the unit tests and whenever a run is configured with one thread.
 *  - StdAsyncExecutor: one std::async task per submission. Suitable for a handful
 *    of long-running tasks such as the five validators of one candidate.
 *  - ThreadPoolExecutor: fixed pool of worker threads sized at construction,
 *    for batches of candidates and bootstrap replicates.
 */
namespace concurrency
{
  inline std::size_t defaultThreadCount()
  {
    const unsigned hw = std::thread::hardware_concurrency();
    return hw ? hw : 2;
  }

  class SingleThreadExecutor : public IParallelExecutor {
  public:
    std::future<void> submit(std::function<void()> task) override {
      std::promise<void> prom;
      auto fut = prom.get_future();
      try {
	task();
	prom.set_value();
      } catch (...) {
	prom.set_exception(std::current_exception());
      }
      return fut;
    }

    std::size_t concurrency() const override {
      return 1;
    }
  };

  class StdAsyncExecutor : public IParallelExecutor {
  public:
    std::future<void> submit(std::function<void()> task) override {
      return std::async(std::launch::async, std::move(task));
    }

    std::size_t concurrency() const override {
      return defaultThreadCount();
    }
  };

  /**
   * @brief Fixed-size thread pool executor.
   *
   * numThreads == 0 selects std::thread::hardware_concurrency() (2 if unknown).
   * Exceptions thrown by a task are delivered through its future. The
   * destructor drains the queue before joining the workers.
   */
  class ThreadPoolExecutor : public IParallelExecutor {
  public:
    ThreadPoolExecutor(const ThreadPoolExecutor&) = delete;
    ThreadPoolExecutor& operator=(const ThreadPoolExecutor&) = delete;
    ThreadPoolExecutor(ThreadPoolExecutor&&) = delete;
    ThreadPoolExecutor& operator=(ThreadPoolExecutor&&) = delete;

    explicit ThreadPoolExecutor(std::size_t numThreads = 0)
      : stop_(false)
    {
      const std::size_t threads = numThreads > 0 ? numThreads : defaultThreadCount();

      try {
	for (std::size_t i = 0; i < threads; ++i) {
	  workers_.emplace_back([this] { workerLoop(); });
	}
      }
      catch (...) {
	shutdown();
	throw;
      }
    }

    ~ThreadPoolExecutor()
    {
      shutdown();
    }

    std::future<void> submit(std::function<void()> task) override
    {
      auto packaged = std::make_shared<std::packaged_task<void()>>(std::move(task));
      auto fut = packaged->get_future();
      {
	std::unique_lock<std::mutex> lock(tasksMutex_);
	if (stop_)
	  throw std::runtime_error("enqueue on stopped ThreadPoolExecutor");
	tasks_.emplace([packaged]() { (*packaged)(); });
      }
      condition_.notify_one();
      return fut;
    }

    std::size_t concurrency() const override
    {
      return workers_.size();
    }

  private:
    void workerLoop()
    {
      for (;;) {
	std::function<void()> task;
	{
	  std::unique_lock<std::mutex> lock(tasksMutex_);
	  condition_.wait(lock, [this]{ return stop_ || !tasks_.empty(); });
	  if (stop_ && tasks_.empty()) return;
	  task = std::move(tasks_.front());
	  tasks_.pop();
	}
	task();
      }
    }

    void shutdown()
    {
      {
	std::lock_guard<std::mutex> lock(tasksMutex_);
	stop_ = true;
      }
      condition_.notify_all();
      for (auto& w : workers_)
	if (w.joinable()) w.join();
    }

  private:
    std::vector<std::thread>          workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex                        tasksMutex_;
    std::condition_variable           condition_;
    bool                              stop_;
  };

  // One thread gives the inline executor; anything else a pool of that size
  // (0 = hardware concurrency).
  inline std::unique_ptr<IParallelExecutor> makeExecutor(std::size_t numThreads)
  {
    if (numThreads == 1)
      return std::make_unique<SingleThreadExecutor>();

    return std::make_unique<ThreadPoolExecutor>(numThreads);
  }
} // namespace concurrency
