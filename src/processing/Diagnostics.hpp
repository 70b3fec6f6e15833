#pragma once

#include <atomic>
#include <cstddef>
#include <string>
#include <string_view>

namespace processing
{

// Switches and formatting helpers for the matching log (plog instance 1).
class Diagnostics
{
public:
    static constexpr int kLogInstance = 1;

    // Code points of a record value shown in a log line
    static constexpr std::size_t kPreviewLength = 60;

    static void SetVerbose(bool enabled) noexcept;
    [[nodiscard]] static bool IsVerbose() noexcept;

    // Quoted, escaped and truncated to kPreviewLength code points
    [[nodiscard]] static std::string Preview(std::string_view text);

    // "algorithm=dice index=17 text=\"...\""
    [[nodiscard]] static std::string QueryContext(std::string_view algorithm, std::size_t index,
                                                  std::string_view text);

private:
    static std::atomic<bool> s_verbose;
};

} // namespace processing
