#pragma once

// RECLINK_PROFILING_LEVEL comes from CMake:
//   0 = scope macros compile to nothing
//   1 = scope timers, per-call lines and an end-of-run summary on the profiling log

#ifndef RECLINK_PROFILING_LEVEL
#define RECLINK_PROFILING_LEVEL 0
#endif

#if RECLINK_PROFILING_LEVEL >= 1
#include <plog/Log.h>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace profiling
{

constexpr int kProfilingLogInstance = 2;

// Call count and accumulated time per scope name, shared by every worker thread
class TimingTable
{
public:
    static TimingTable& Instance()
    {
        static TimingTable table;
        return table;
    }

    void record(std::string_view name, std::chrono::microseconds elapsed)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Entry& entry = entries_[std::string(name)];
        ++entry.calls;
        entry.total += elapsed;
    }

    // Logs one line per scope, largest total first, then starts over
    void flush()
    {
        std::vector<std::pair<std::string, Entry>> rows;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            rows.assign(entries_.begin(), entries_.end());
            entries_.clear();
        }
        std::sort(rows.begin(), rows.end(),
                  [](const auto& a, const auto& b) { return a.second.total > b.second.total; });

        for (const auto& [name, entry] : rows)
        {
            PLOG_INFO_(kProfilingLogInstance) << "[PROFILE] " << name << " calls=" << entry.calls
                                              << " total=" << entry.total.count() << "us";
        }
    }

private:
    struct Entry
    {
        std::size_t calls = 0;
        std::chrono::microseconds total{ 0 };
    };

    std::mutex mutex_;
    std::map<std::string, Entry> entries_;
};

namespace detail
{

// The name must outlive the timer
class ScopeTimer
{
public:
    explicit ScopeTimer(std::string_view name)
        : name_(name)
        , start_(std::chrono::steady_clock::now())
    {
    }

    ~ScopeTimer()
    {
        const auto elapsed =
            std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start_);
        PLOG_DEBUG_(kProfilingLogInstance) << "[PROFILE] " << name_ << " took " << elapsed.count() << " us";
        TimingTable::Instance().record(name_, elapsed);
    }

    ScopeTimer(const ScopeTimer&) = delete;
    ScopeTimer& operator=(const ScopeTimer&) = delete;

private:
    std::string_view name_;
    std::chrono::steady_clock::time_point start_;
};

} // namespace detail

} // namespace profiling

#define PROFILE_SCOPE_FUNCTION() ::profiling::detail::ScopeTimer reclink_scope_timer_(__FUNCTION__)
#define PROFILE_SCOPE_CUSTOM(nameExpr) ::profiling::detail::ScopeTimer reclink_scope_timer_(nameExpr)
#define PROFILE_FLUSH() ::profiling::TimingTable::Instance().flush()

#else

#define PROFILE_SCOPE_FUNCTION() ((void)0)
#define PROFILE_SCOPE_CUSTOM(nameExpr) ((void)sizeof(nameExpr))
#define PROFILE_FLUSH() ((void)0)

#endif
