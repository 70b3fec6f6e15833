#pragma once

#include "Diagnostics.hpp"
#include "TextProcessingTypes.hpp"
#include "../utils/ErrorReporter.hpp"
#include "../utils/Profile.hpp"

#include <plog/Log.h>

#include <chrono>
#include <exception>
#include <string>
#include <utility>

namespace processing
{

namespace detail
{

inline std::chrono::microseconds elapsedSince(std::chrono::steady_clock::time_point start)
{
    return std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start);
}

template<typename T>
StageResult<T> stageFailed(const std::string& stage_name, const std::string& message,
                           std::chrono::microseconds elapsed, utils::ErrorCategory category)
{
    PLOG_ERROR_(Diagnostics::kLogInstance) << "[" << stage_name << "] failed after " << elapsed.count()
                                           << "us: " << message;
    utils::ErrorReporter::ReportError(category, "Stage failed: " + stage_name, message);
    return StageResult<T>::failure(message, elapsed, stage_name);
}

} // namespace detail

/**
 * @brief Runs one named stage of a match run ("dice.prepare", ...).
 *
 * An exception escaping fn turns into a failed StageResult carrying its
 * message, logged on the matching log and reported under category.
 */
template<typename T, typename Fn>
StageResult<T> run_stage(const std::string& stage_name, Fn&& fn,
                         utils::ErrorCategory category = utils::ErrorCategory::Matching)
{
    PROFILE_SCOPE_CUSTOM(stage_name);

    const auto start = std::chrono::steady_clock::now();
    try
    {
        auto outcome = StageResult<T>::success(std::forward<Fn>(fn)(), detail::elapsedSince(start), stage_name);
        if (Diagnostics::IsVerbose())
        {
            PLOG_DEBUG_(Diagnostics::kLogInstance) << "[" << stage_name << "] done in " << outcome.duration.count()
                                                   << "us";
        }
        return outcome;
    }
    catch (const std::exception& ex)
    {
        return detail::stageFailed<T>(stage_name, ex.what(), detail::elapsedSince(start), category);
    }
    catch (...)
    {
        return detail::stageFailed<T>(stage_name, "non-standard exception", detail::elapsedSince(start), category);
    }
}

} // namespace processing
