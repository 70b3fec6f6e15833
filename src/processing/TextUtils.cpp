#include "TextUtils.hpp"
#include <utf8proc.h>

namespace processing
{

std::u32string utf8ToUtf32(std::string_view utf8_str)
{
    std::u32string result;
    if (utf8_str.empty())
        return result;

    const utf8proc_uint8_t* str = reinterpret_cast<const utf8proc_uint8_t*>(utf8_str.data());
    utf8proc_ssize_t len = static_cast<utf8proc_ssize_t>(utf8_str.size());

    result.reserve(utf8_str.size());
    utf8proc_ssize_t pos = 0;
    while (pos < len)
    {
        utf8proc_int32_t codepoint;
        utf8proc_ssize_t bytes = utf8proc_iterate(str + pos, len - pos, &codepoint);
        if (bytes <= 0)
        {
            ++pos;
            continue;
        }
        result.push_back(static_cast<char32_t>(codepoint));
        pos += bytes;
    }
    return result;
}

std::string utf32ToUtf8(const std::u32string& utf32_str)
{
    std::string result;
    result.reserve(utf32_str.size());
    for (char32_t cp : utf32_str)
    {
        utf8proc_uint8_t buffer[4];
        utf8proc_ssize_t bytes = utf8proc_encode_char(static_cast<utf8proc_int32_t>(cp), buffer);
        if (bytes > 0)
        {
            result.append(reinterpret_cast<const char*>(buffer), static_cast<size_t>(bytes));
        }
    }
    return result;
}

bool isWhitespaceChar(char32_t cp)
{
    if (cp == U' ' || (cp >= U'\t' && cp <= U'\r'))
        return true;

    switch (utf8proc_category(static_cast<utf8proc_int32_t>(cp)))
    {
    case UTF8PROC_CATEGORY_ZS:
    case UTF8PROC_CATEGORY_ZL:
    case UTF8PROC_CATEGORY_ZP:
        return true;
    default:
        return false;
    }
}

bool isAlphanumericChar(char32_t cp)
{
    switch (utf8proc_category(static_cast<utf8proc_int32_t>(cp)))
    {
    case UTF8PROC_CATEGORY_LU:
    case UTF8PROC_CATEGORY_LL:
    case UTF8PROC_CATEGORY_LT:
    case UTF8PROC_CATEGORY_LM:
    case UTF8PROC_CATEGORY_LO:
    case UTF8PROC_CATEGORY_ND:
    case UTF8PROC_CATEGORY_NL:
    case UTF8PROC_CATEGORY_NO:
        return true;
    default:
        return false;
    }
}

std::u32string trimWhitespace(const std::u32string& s)
{
    std::size_t begin = 0;
    std::size_t end = s.size();
    while (begin < end && isWhitespaceChar(s[begin]))
        ++begin;
    while (end > begin && isWhitespaceChar(s[end - 1]))
        --end;
    return s.substr(begin, end - begin);
}

std::vector<std::string> splitTokens(std::string_view text)
{
    std::vector<std::string> tokens;
    std::u32string current;
    for (char32_t cp : utf8ToUtf32(text))
    {
        if (isWhitespaceChar(cp))
        {
            if (!current.empty())
            {
                tokens.push_back(utf32ToUtf8(current));
                current.clear();
            }
            continue;
        }
        current.push_back(cp);
    }
    if (!current.empty())
        tokens.push_back(utf32ToUtf8(current));
    return tokens;
}

} // namespace processing
