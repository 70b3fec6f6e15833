#include <catch2/catch_test_macros.hpp>
#include "utils/WorkerPool.hpp"

#include <atomic>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>

using utils::WorkerPool;

TEST_CASE("WorkerPool - results come back in index order", "[worker_pool]")
{
    WorkerPool pool(4);
    auto results = pool.map(100, [](std::size_t i) { return static_cast<int>(i * i); });

    REQUIRE(results.size() == 100);
    for (std::size_t i = 0; i < results.size(); ++i)
    {
        REQUIRE(results[i].index == i);
        REQUIRE(results[i].ok());
        REQUIRE(*results[i].value == static_cast<int>(i * i));
    }
}

TEST_CASE("WorkerPool - a throwing task does not stop the others", "[worker_pool]")
{
    WorkerPool pool(3);
    std::atomic<int> calls{ 0 };
    auto results = pool.map(10,
                            [&calls](std::size_t i) -> std::string
                            {
                                ++calls;
                                if (i == 4)
                                    throw std::runtime_error("bad row");
                                return std::to_string(i);
                            });

    REQUIRE(calls.load() == 10);
    REQUIRE(results.size() == 10);
    REQUIRE_FALSE(results[4].ok());
    REQUIRE(results[4].index == 4);
    REQUIRE(results[4].error == "bad row");
    REQUIRE(results[5].ok());
    REQUIRE(*results[5].value == "5");
}

TEST_CASE("WorkerPool - non-standard exceptions are captured", "[worker_pool]")
{
    WorkerPool pool(1);
    auto results = pool.map(2,
                            [](std::size_t i) -> int
                            {
                                if (i == 1)
                                    throw 42;
                                return 0;
                            });

    REQUIRE(results[0].ok());
    REQUIRE_FALSE(results[1].ok());
    REQUIRE(results[1].error == "unknown exception");
}

TEST_CASE("WorkerPool - sizing", "[worker_pool]")
{
    REQUIRE(WorkerPool(3).size() == 3);
    REQUIRE(WorkerPool(0).size() == WorkerPool::DefaultWorkerCount());
    REQUIRE(WorkerPool::DefaultWorkerCount() >= 1);
    REQUIRE(WorkerPool::DefaultWorkerCount() <= 32);
}

TEST_CASE("WorkerPool - empty batch", "[worker_pool]")
{
    WorkerPool pool(8);
    auto results = pool.map(0, [](std::size_t) { return 1; });
    REQUIRE(results.empty());
}

TEST_CASE("WorkerPool - tasks run on the pool threads", "[worker_pool]")
{
    WorkerPool pool(3);
    const std::thread::id caller = std::this_thread::get_id();
    std::mutex mutex;
    std::set<std::thread::id> seen;

    auto results = pool.map(64,
                            [&](std::size_t i)
                            {
                                std::lock_guard<std::mutex> lock(mutex);
                                seen.insert(std::this_thread::get_id());
                                return i;
                            });

    REQUIRE(results.size() == 64);
    REQUIRE(results[63].ok());
    REQUIRE(*results[63].value == 63u);
    REQUIRE_FALSE(seen.empty());
    REQUIRE(seen.size() <= pool.size());
    REQUIRE(seen.count(caller) == 0);
}

TEST_CASE("WorkerPool - one pool serves several batches", "[worker_pool]")
{
    WorkerPool pool(2);
    for (int round = 0; round < 3; ++round)
    {
        auto results = pool.map(5,
                                [round](std::size_t i) -> int
                                {
                                    if (i == static_cast<std::size_t>(round))
                                        throw std::invalid_argument("round " + std::to_string(round));
                                    return round;
                                });

        REQUIRE(results.size() == 5);
        REQUIRE_FALSE(results[round].ok());
        REQUIRE(results[round].error == "round " + std::to_string(round));
        REQUIRE(results[4].ok());
        REQUIRE(*results[4].value == round);
    }
}
