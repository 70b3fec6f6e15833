#pragma once

#include <cstddef>
#include <string_view>

namespace matching
{

// Pairwise scores of two normalized strings, the per-pair formulas behind the
// matchers. Every function returns 0 (false) when either side is empty.
namespace similarity
{

// 1 - levenshtein(a, b) / max(|a|, |b|) over code points
double levenshtein(std::string_view a, std::string_view b);

// |A ∩ B| / |A ∪ B| over whitespace token sets
double jaccard(std::string_view a, std::string_view b);

// 2|A ∩ B| / (|A| + |B|) over character bigram multisets
double dice(std::string_view a, std::string_view b);

// |A ∩ B| / (|A| + |B| - |A ∩ B|) over character n-gram multisets
double ngram(std::string_view a, std::string_view b, std::size_t n = 2);

// Either string contains the other
bool contains(std::string_view a, std::string_view b);

// Cosine of the raw token count vectors
double cosine(std::string_view a, std::string_view b);

} // namespace similarity

} // namespace matching
