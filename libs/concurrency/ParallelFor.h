#pragma once

#include <cstdint>
#include <vector>
#include <future>
#include <algorithm>
#include "IParallelExecutor.h"

namespace concurrency {

  // Split [0, total) into at most executor.concurrency() contiguous chunks,
  // submit each chunk, then waitAll. body(i) is called once per index.
  template<typename Executor, typename Body>
  void parallel_for(uint32_t total, Executor& exec, Body body) {
    if (total == 0) return;

    const std::size_t workers = exec.concurrency();
    const uint32_t numTasks = static_cast<uint32_t>(workers ? workers : 1);
    const uint32_t chunkSize = (total + numTasks - 1) / numTasks; // ceil-divide

    std::vector<std::future<void>> futures;
    for (uint32_t start = 0; start < total; start += chunkSize)
      {
	uint32_t end = std::min(total, start + chunkSize);
	futures.emplace_back(
			     exec.submit([=]() {
				 for (uint32_t p = start; p < end; ++p) {
				   body(p);
				 }
			       })
			     );
      }
    exec.waitAll(futures);
  }
}
