#include "MatchTypes.hpp"

#include <algorithm>
#include <cctype>

namespace matching
{

const char* algorithmName(Algorithm algorithm)
{
    switch (algorithm)
    {
    case Algorithm::Levenshtein:
        return "levenshtein";
    case Algorithm::Jaccard:
        return "jaccard";
    case Algorithm::Dice:
        return "dice";
    case Algorithm::Ngram:
        return "ngram";
    case Algorithm::Regex:
        return "regex";
    case Algorithm::Tfidf:
        return "tfidf";
    default:
        return "unknown";
    }
}

std::string algorithmLabel(Algorithm algorithm)
{
    std::string label = algorithmName(algorithm);
    std::transform(label.begin(), label.end(), label.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return label;
}

std::optional<Algorithm> parseAlgorithm(std::string_view name)
{
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (Algorithm algorithm : allAlgorithms())
    {
        if (lowered == algorithmName(algorithm))
            return algorithm;
    }
    return std::nullopt;
}

const std::array<Algorithm, 6>& allAlgorithms()
{
    static const std::array<Algorithm, 6> algorithms{ Algorithm::Regex, Algorithm::Levenshtein, Algorithm::Jaccard,
                                                      Algorithm::Tfidf, Algorithm::Ngram,       Algorithm::Dice };
    return algorithms;
}

double defaultThreshold(Algorithm algorithm)
{
    return algorithm == Algorithm::Levenshtein ? 0.8 : 0.5;
}

ScoreKind scoreKindOf(Algorithm algorithm)
{
    return algorithm == Algorithm::Regex ? ScoreKind::Boolean : ScoreKind::Continuous;
}

void applyThreshold(std::vector<MatchResult>& results, double threshold)
{
    for (auto& result : results)
        result.accepted = result.score.has_value() && *result.score >= threshold;
}

} // namespace matching
