#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <utility>

namespace processing
{

// One attribute of a record: the cell as read and its comparison form.
// Records are identified by their row position in the source table.
struct TextRecord
{
    std::string original;   // empty for a missing cell
    std::string normalized; // RecordNormalizer output

    bool blank() const { return normalized.empty(); }
};

/**
 * @brief Outcome of one named stage of a match run.
 *
 * A failed stage keeps a default-constructed result, the error message and
 * the time spent before the failure.
 */
template<typename T>
struct StageResult
{
    T result{};
    bool succeeded = true;
    std::optional<std::string> error;
    std::chrono::microseconds duration{ 0 };
    std::string stage_name;

    explicit operator bool() const { return succeeded; }

    static StageResult success(T value, std::chrono::microseconds elapsed, std::string stage)
    {
        StageResult out;
        out.result = std::move(value);
        out.duration = elapsed;
        out.stage_name = std::move(stage);
        return out;
    }

    static StageResult failure(std::string message, std::chrono::microseconds elapsed, std::string stage)
    {
        StageResult out;
        out.succeeded = false;
        out.error = std::move(message);
        out.duration = elapsed;
        out.stage_name = std::move(stage);
        return out;
    }
};

} // namespace processing
