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
 * @brief Executor policies for the per record stages of the ledger pipeline.
 *
 *  - SingleThreadExecutor: runs tasks inline on the calling thread. Results are
 *    deterministic, which is what the pipeline uses by default and in tests.
 *  - ThreadPoolExecutor: a pool of worker threads fed from one queue. The
 *    worker count is fixed at construction.
 */
namespace concurrency
{
  /**
   * @brief Executes tasks synchronously on the calling thread.
   */
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

    std::size_t getNumWorkers() const override {
      return 1;
    }
  };

  /**
   * @brief Fixed-size thread pool executor.
   *
   * The template parameter N is the default worker count used by the default
   * constructor. N == 0 picks std::thread::hardware_concurrency() (falling
   * back to 2 if that returns 0). The explicit constructor takes the worker
   * count at run time, e.g. from configuration.
   */
  template <std::size_t N = 0>
  class ThreadPoolExecutor : public IParallelExecutor {
  public:
    ThreadPoolExecutor(const ThreadPoolExecutor&) = delete;
    ThreadPoolExecutor& operator=(const ThreadPoolExecutor&) = delete;
    ThreadPoolExecutor(ThreadPoolExecutor&&) = delete;
    ThreadPoolExecutor& operator=(ThreadPoolExecutor&&) = delete;

    ThreadPoolExecutor()
      : ThreadPoolExecutor(N)
    {}

    explicit ThreadPoolExecutor(std::size_t numThreads)
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
	  throw std::runtime_error("ThreadPoolExecutor: submit on a stopped pool");
	tasks_.emplace([packaged]() { (*packaged)(); });
      }
      condition_.notify_one();
      return fut;
    }

    std::size_t getNumWorkers() const override
    {
      return workers_.size();
    }

  private:
    static std::size_t defaultThreadCount()
    {
      const unsigned hw = std::thread::hardware_concurrency();
      return hw ? hw : 2;
    }

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
      for (auto& worker : workers_) {
	if (worker.joinable())
	  worker.join();
      }
    }

  private:
    std::vector<std::thread>          workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex                        tasksMutex_;
    std::condition_variable           condition_;
    bool                              stop_;
  };
} // namespace concurrency
