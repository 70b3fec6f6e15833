#include "Diagnostics.hpp"
#include "TextUtils.hpp"

#include <algorithm>

namespace processing
{

std::atomic<bool> Diagnostics::s_verbose{ false };

void Diagnostics::SetVerbose(bool enabled) noexcept
{
    s_verbose.store(enabled, std::memory_order_relaxed);
}

bool Diagnostics::IsVerbose() noexcept
{
    return s_verbose.load(std::memory_order_relaxed);
}

std::string Diagnostics::Preview(std::string_view text)
{
    const std::u32string chars = utf8ToUtf32(text);
    const bool truncated = chars.size() > kPreviewLength;

    std::u32string shown;
    shown.reserve(std::min(chars.size(), kPreviewLength) + 8);
    shown.push_back(U'"');
    for (std::size_t i = 0; i < chars.size() && i < kPreviewLength; ++i)
    {
        const char32_t cp = chars[i];
        if (cp == U'\n')
            shown += U"\\n";
        else if (cp == U'\t')
            shown += U"\\t";
        else if (cp == U'"')
            shown += U"\\\"";
        else if (cp < 0x20 || cp == 0x7F)
            shown.push_back(U'?');
        else
            shown.push_back(cp);
    }
    shown.push_back(U'"');

    std::string out = utf32ToUtf8(shown);
    if (truncated)
        out += "... (" + std::to_string(chars.size()) + " chars)";
    return out;
}

std::string Diagnostics::QueryContext(std::string_view algorithm, std::size_t index, std::string_view text)
{
    return "algorithm=" + std::string(algorithm) + " index=" + std::to_string(index) + " text=" + Preview(text);
}

} // namespace processing
