#pragma once

#include "ITextNormalizer.hpp"
#include "TextProcessingTypes.hpp"

#include <optional>
#include <string>

namespace processing
{

/**
 * @brief Canonical comparison form for record attributes (names, addresses).
 *
 * Steps, in order:
 * - Unicode NFKC (full-width forms, ligatures and decomposed umlauts become comparable)
 * - ordered substring replacements: abbreviation expansions, then umlaut/sharp-s folding
 * - lowercase
 * - trim surrounding whitespace
 * - drop every code point that is neither a letter, a number nor whitespace
 *
 * The result is trimmed once more so that normalize(normalize(x)) == normalize(x).
 * Pure and thread-safe; never throws on malformed UTF-8 (bad bytes are dropped).
 *
 * Example:
 * @code
 * RecordNormalizer normalizer;
 * normalizer.normalize("Dr. Müller-Str. 12"); // "dr muellerstrasse 12"
 * @endcode
 */
class RecordNormalizer : public ITextNormalizer
{
public:
    RecordNormalizer() = default;
    ~RecordNormalizer() override = default;

    [[nodiscard]] std::string normalize(const std::string& text) const override;
    [[nodiscard]] TextRecord makeRecord(const std::optional<std::string>& value) const override;

    // Missing cells are treated as empty strings
    [[nodiscard]] std::string normalizeCell(const std::optional<std::string>& text) const;

    // Ordered substring replacement table: abbreviations, then folding
    [[nodiscard]] std::string applyReplacements(const std::string& text) const;

private:
    [[nodiscard]] std::string composeNFKC(const std::string& text) const;
};

} // namespace processing
