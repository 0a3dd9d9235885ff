// concurrency/IParallelExecutor.h
#pragma once
#include <cstddef>
#include <future>
#include <vector>
#include <functional>

namespace concurrency
{
  /**
   * @brief Abstract executor used by parallel_for to run independent tasks.
   */
  class IParallelExecutor {
  public:
    virtual ~IParallelExecutor() = default;

    // Schedule a void() task; returns a std::future you can wait on.
    virtual std::future<void> submit(std::function<void()> task) = 0;

    // Number of tasks that can make progress at the same time.
    virtual std::size_t getNumWorkers() const = 0;

    // Wait on every future. The first stored exception is rethrown after all
    // tasks have finished, so no task still refers to caller state.
    virtual void waitAll(std::vector<std::future<void>>& futures) {
      std::exception_ptr firstError;
      for (auto& f : futures) {
	try {
	  f.get();
	}
	catch (...) {
	  if (!firstError)
	    firstError = std::current_exception();
	}
      }

      if (firstError)
	std::rethrow_exception(firstError);
    }
  };
} // namespace concurrency
