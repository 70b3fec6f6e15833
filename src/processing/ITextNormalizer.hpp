#pragma once

#include "TextProcessingTypes.hpp"

#include <optional>
#include <string>
#include <vector>

namespace processing
{

// Maps raw cell values to the form every matcher compares.
class ITextNormalizer
{
public:
    virtual ~ITextNormalizer() = default;

    [[nodiscard]] virtual std::string normalize(const std::string& text) const = 0;

    // A missing cell yields a record with empty original and normalized text
    [[nodiscard]] virtual TextRecord makeRecord(const std::optional<std::string>& value) const = 0;

    [[nodiscard]] std::vector<TextRecord> makeRecords(const std::vector<std::optional<std::string>>& column) const
    {
        std::vector<TextRecord> records;
        records.reserve(column.size());
        for (const auto& value : column)
            records.push_back(makeRecord(value));
        return records;
    }
};

} // namespace processing
