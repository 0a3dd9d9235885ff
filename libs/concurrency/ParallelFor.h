#pragma once

#include <cstdint>
#include <vector>
#include <future>
#include <algorithm>

namespace concurrency {

  // Split [0…total) into one contiguous chunk per executor worker, submit
  // each chunk, then wait for all of them. body(i) is called exactly once for
  // every i; callers that write only to slot i need no locking.
  template<typename Executor, typename Body>
  void parallel_for(uint32_t total, Executor& exec, Body body) {
    if (total == 0) return;

    const uint32_t numTasks = static_cast<uint32_t>(std::max<std::size_t>(exec.getNumWorkers(), 1));
    const uint32_t chunkSize = (total + numTasks - 1) / numTasks; // ceil-divide

    std::vector<std::future<void>> futures;
    futures.reserve(numTasks);
    for (uint32_t start = 0; start < total; start += chunkSize)
      {
	const uint32_t end = std::min(total, start + chunkSize);
	futures.emplace_back(exec.submit([start, end, &body]() {
	      for (uint32_t p = start; p < end; ++p)
		body(p);
	    }));
      }
    exec.waitAll(futures);
  }

  // Applies body to each element of a random access container
  template<typename Executor, typename Container, typename Body>
  void parallel_for_each(Executor& exec, const Container& container, Body body) {
    parallel_for(static_cast<uint32_t>(container.size()), exec,
		 [&container, &body](uint32_t p) { body(container[p]); });
  }
}
