#pragma once

#include "MatchAlgorithmBase.hpp"

#include <string>
#include <vector>

namespace matching
{

/**
 * @brief Normalized edit distance over code points, 1 - dist / max(|q|, |r|).
 *
 * Uses rapidfuzz's cached Levenshtein scorer: the query pattern is built once
 * and every reference is scored with a cutoff at the best score seen so far.
 */
class LevenshteinMatcher : public MatchAlgorithmBase
{
public:
    Algorithm algorithm() const override { return Algorithm::Levenshtein; }

protected:
    void onPrepare() override;
    void onReset() override;
    Candidate searchQuery(std::size_t query_index) const override;

private:
    std::vector<std::u32string> reference_text_;
};

} // namespace matching
