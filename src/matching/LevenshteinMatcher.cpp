#include "LevenshteinMatcher.hpp"

#include "processing/TextUtils.hpp"

#include <rapidfuzz/distance/Levenshtein.hpp>

#include <algorithm>

namespace matching
{

void LevenshteinMatcher::onReset()
{
    reference_text_.clear();
}

void LevenshteinMatcher::onPrepare()
{
    reference_text_.reserve(reference().size());
    for (const auto& record : reference())
        reference_text_.push_back(processing::utf8ToUtf32(record.normalized));
}

LevenshteinMatcher::Candidate LevenshteinMatcher::searchQuery(std::size_t query_index) const
{
    const std::u32string query = processing::utf8ToUtf32(queries().at(query_index).normalized);
    if (query.empty())
        return {};

    rapidfuzz::CachedLevenshtein<char32_t> scorer(query);

    Candidate best;
    double best_score = -1.0;
    for (std::size_t r = 0; r < reference_text_.size(); ++r)
    {
        // Scores below the cutoff come back as 0 and cannot beat the current best
        const double score = scorer.normalized_similarity(reference_text_[r], std::max(best_score, 0.0));
        if (score > best_score)
        {
            best_score = score;
            best.reference_index = r;
            if (best_score >= 1.0)
                break;
        }
    }
    best.score = best_score;
    return best;
}

} // namespace matching
