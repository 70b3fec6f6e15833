#include "RecordNormalizer.hpp"
#include "ReplacementRules.hpp"
#include "TextUtils.hpp"
#include "Diagnostics.hpp"

#include <utf8proc.h>
#include <plog/Log.h>

#include <cstdlib>

namespace processing
{

namespace
{

void replaceAll(std::string& target, std::string_view pattern, std::string_view value)
{
    if (pattern.empty())
        return;

    std::size_t pos = 0;
    while ((pos = target.find(pattern, pos)) != std::string::npos)
    {
        target.replace(pos, pattern.size(), value);
        pos += value.size();
    }
}

} // namespace

std::string RecordNormalizer::composeNFKC(const std::string& text) const
{
    utf8proc_uint8_t* normalized = utf8proc_NFKC(reinterpret_cast<const utf8proc_uint8_t*>(text.c_str()));

    if (!normalized)
    {
        PLOG_WARNING_(Diagnostics::kLogInstance)
            << "NFKC normalization failed, continuing with raw text " << Diagnostics::Preview(text);
        return text;
    }

    std::string nfkc_normalized(reinterpret_cast<char*>(normalized));
    std::free(normalized);
    return nfkc_normalized;
}

std::string RecordNormalizer::applyReplacements(const std::string& text) const
{
    std::string out = text;
    for (const auto& rule : replacement_rules::kAbbreviations)
        replaceAll(out, rule.pattern, rule.replacement);
    for (const auto& rule : replacement_rules::kCharacterFolding)
        replaceAll(out, rule.pattern, rule.replacement);
    return out;
}

std::string RecordNormalizer::normalize(const std::string& text) const
{
    if (text.empty())
        return text;

    std::u32string folded = utf8ToUtf32(applyReplacements(composeNFKC(text)));
    for (char32_t& cp : folded)
        cp = static_cast<char32_t>(utf8proc_tolower(static_cast<utf8proc_int32_t>(cp)));

    std::u32string trimmed = trimWhitespace(folded);

    std::u32string kept;
    kept.reserve(trimmed.size());
    for (char32_t cp : trimmed)
    {
        if (isAlphanumericChar(cp) || isWhitespaceChar(cp))
            kept.push_back(cp);
    }

    return utf32ToUtf8(trimWhitespace(kept));
}

std::string RecordNormalizer::normalizeCell(const std::optional<std::string>& text) const
{
    return text ? normalize(*text) : std::string();
}

TextRecord RecordNormalizer::makeRecord(const std::optional<std::string>& value) const
{
    TextRecord record;
    record.original = value.value_or(std::string());
    record.normalized = normalize(record.original);
    return record;
}

} // namespace processing
