#include "IMatchAlgorithm.hpp"

#include "ContainmentMatcher.hpp"
#include "DiceMatcher.hpp"
#include "JaccardMatcher.hpp"
#include "LevenshteinMatcher.hpp"
#include "NgramMatcher.hpp"
#include "TfidfMatcher.hpp"

namespace matching
{

std::unique_ptr<IMatchAlgorithm> createMatcher(Algorithm algorithm, const MatcherOptions& options)
{
    switch (algorithm)
    {
    case Algorithm::Levenshtein:
        return std::make_unique<LevenshteinMatcher>();
    case Algorithm::Jaccard:
        return std::make_unique<JaccardMatcher>();
    case Algorithm::Dice:
        return std::make_unique<DiceMatcher>();
    case Algorithm::Ngram:
        return std::make_unique<NgramMatcher>(options.ngram_size);
    case Algorithm::Regex:
        return std::make_unique<ContainmentMatcher>();
    case Algorithm::Tfidf:
        return std::make_unique<TfidfMatcher>();
    default:
        return nullptr;
    }
}

} // namespace matching
