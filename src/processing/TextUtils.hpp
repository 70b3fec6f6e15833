#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace processing
{

/// UTF-8 to UTF-32 conversion; malformed bytes are skipped one at a time
std::u32string utf8ToUtf32(std::string_view utf8_str);

/// UTF-32 to UTF-8 conversion
std::string utf32ToUtf8(const std::u32string& utf32_str);

/// Unicode whitespace (ASCII controls \t..\r plus categories Zs, Zl, Zp)
bool isWhitespaceChar(char32_t cp);

/// Letters (L*) and numbers (N*)
bool isAlphanumericChar(char32_t cp);

/// Removes leading and trailing Unicode whitespace
std::u32string trimWhitespace(const std::u32string& s);

/// Splits on runs of Unicode whitespace; never yields empty tokens
std::vector<std::string> splitTokens(std::string_view text);

} // namespace processing
