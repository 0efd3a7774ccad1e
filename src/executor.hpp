#pragma once

// Batch parallelism on a shared Taskflow executor.
//
// Work below a caller-chosen size runs inline on the calling thread;
// anything larger is spread across the process-global work-stealing
// executor, created on first use.
//
// Internal header — not installed.

#include <cstddef>

#include <taskflow/taskflow.hpp>
#include <taskflow/algorithm/for_each.hpp>

namespace score_history::detail {

inline auto global_executor() -> tf::Executor& {
    static auto executor = tf::Executor{};
    return executor;
}

// Call fn(i) for every i in [0, count). Blocks until all calls return.
// fn must not throw.
template <typename Fn>
void for_each_index(std::size_t count, std::size_t parallel_threshold, Fn&& fn) {
    if (count < parallel_threshold) {
        for (std::size_t i = 0; i < count; ++i) fn(i);
        return;
    }
    auto flow = tf::Taskflow{};
    flow.for_each_index(std::size_t{0}, count, std::size_t{1}, fn);
    global_executor().run(flow).wait();
}

}  // namespace score_history::detail
