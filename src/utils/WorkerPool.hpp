#pragma once

#include <BS_thread_pool.hpp>

#include <algorithm>
#include <cstddef>
#include <exception>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace utils
{

// Outcome of one task in a WorkerPool::map call. Exactly one of value / error is set.
template<typename T>
struct TaskResult
{
    std::size_t index = 0;
    std::optional<T> value;
    std::string error;

    bool ok() const { return value.has_value(); }

    static TaskResult success(std::size_t i, T v)
    {
        TaskResult r;
        r.index = i;
        r.value = std::move(v);
        return r;
    }

    static TaskResult failure(std::size_t i, std::string err)
    {
        TaskResult r;
        r.index = i;
        r.error = std::move(err);
        return r;
    }
};

/**
 * @brief Bounded fan-out of independent, CPU-bound tasks on a BS::light_thread_pool.
 *
 * map(count, fn) submits fn(0) .. fn(count - 1) to the pool and returns one
 * TaskResult per index, in index order regardless of completion order. An
 * exception thrown by fn(i) comes back through future i and is captured into
 * result i; the other tasks keep running. There is no cancellation and no retry.
 *
 * fn must be safe to call concurrently: it may only read shared state.
 */
class WorkerPool
{
public:
    // min(32, hardware threads + 4)
    static std::size_t DefaultWorkerCount()
    {
        const std::size_t hw = std::max<std::size_t>(1, std::thread::hardware_concurrency());
        return std::min<std::size_t>(32, hw + 4);
    }

    explicit WorkerPool(std::size_t workers = DefaultWorkerCount())
        : pool_(std::make_unique<BS::light_thread_pool>(workers == 0 ? DefaultWorkerCount() : workers))
    {
    }

    std::size_t size() const { return pool_->get_thread_count(); }

    template<typename Fn>
    auto map(std::size_t count, Fn&& fn) const -> std::vector<TaskResult<std::invoke_result_t<Fn&, std::size_t>>>
    {
        using T = std::invoke_result_t<Fn&, std::size_t>;

        std::vector<std::future<T>> futures;
        futures.reserve(count);
        for (std::size_t i = 0; i < count; ++i)
            futures.push_back(pool_->submit_task([&fn, i]() -> T { return fn(i); }));

        // Every future is drained before returning; the tasks hold a reference to fn.
        std::vector<TaskResult<T>> results;
        results.reserve(count);
        for (std::size_t i = 0; i < count; ++i)
        {
            try
            {
                results.push_back(TaskResult<T>::success(i, futures[i].get()));
            }
            catch (const std::exception& ex)
            {
                results.push_back(TaskResult<T>::failure(i, ex.what()));
            }
            catch (...)
            {
                results.push_back(TaskResult<T>::failure(i, "unknown exception"));
            }
        }
        return results;
    }

private:
    std::unique_ptr<BS::light_thread_pool> pool_;
};

} // namespace utils
