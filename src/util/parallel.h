#pragma once

/// @file parallel.h
/// @brief Fork/join parallel-for with a single join barrier.

#include <cstddef>
#include <functional>

namespace chromaflow {

/// @brief Runs body(i) for every i in [0, count) across worker threads and joins.
/// @param count Number of work items
/// @param body Work item function; must only touch state private to item i
/// @param parallel If false, runs every item on the calling thread in order
/// @details Blocks until every item has completed. If any item throws, the first
///          exception captured is rethrown on the calling thread after the join.
///          Worker threads are started and joined on every call; there is no
///          persistent pool.
void parallel_for(size_t count, const std::function<void(size_t)>& body, bool parallel = true);

/// @brief Returns the number of worker threads parallel_for will use for count items.
size_t parallel_worker_count(size_t count);

}  // namespace chromaflow
