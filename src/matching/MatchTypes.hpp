#pragma once

#include "processing/TextProcessingTypes.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace matching
{

using Corpus = std::vector<processing::TextRecord>;

/**
 * @brief Similarity measures supported by the matcher factory.
 */
enum class Algorithm
{
    Levenshtein = 0, // Normalized edit distance over code points
    Jaccard = 1,     // Token set overlap
    Dice = 2,        // Character bigram multiset overlap, 2|q∩r| / (|q|+|r|)
    Ngram = 3,       // Character n-gram multiset overlap, |q∩r| / |q∪r|
    Regex = 4,       // Substring containment in either direction (boolean score)
    Tfidf = 5        // Cosine similarity of TF-IDF weighted token vectors
};

enum class ScoreKind
{
    Continuous, // score in [0, 1]
    Boolean     // score is 1.0 (true) or 0.0 (false)
};

// Forward-only lifecycle; prepare() may be called again from any state and restarts at Prepared.
enum class MatchState
{
    Unprepared,
    Prepared,
    Searched,
    Classified
};

/**
 * @brief Best match found for one query.
 */
struct MatchResult
{
    std::size_t query_index = 0;                 // Row position of the query in its source table
    std::string query;                           // Original query text
    std::optional<std::string> best_match;       // Original reference text, absent when nothing matched
    std::optional<std::size_t> best_match_index; // Row position of the best match in the reference corpus
    std::optional<double> score;                 // Similarity, absent for empty queries
    std::optional<bool> ground_truth;            // Filled in later by human validation
    std::optional<bool> accepted;                // score >= threshold, set by classify()
};

struct QueryFailure
{
    std::size_t query_index = 0;
    std::string query;
    std::string reason;
};

struct SearchOutcome
{
    std::vector<MatchResult> results;  // Successful queries in input order
    std::vector<QueryFailure> failures; // Queries whose scoring threw, in input order
};

struct MatcherOptions
{
    std::size_t ngram_size = 2; // n for the character n-gram matcher (Dice is always bigram)
};

// Lowercase identifier used in configuration ("levenshtein", "regex", ...)
const char* algorithmName(Algorithm algorithm);

// Uppercase label used as column prefix in exported tables ("LEVENSHTEIN", ...)
std::string algorithmLabel(Algorithm algorithm);

std::optional<Algorithm> parseAlgorithm(std::string_view name);

const std::array<Algorithm, 6>& allAlgorithms();

// Defaults: levenshtein 0.8, every other algorithm 0.5
double defaultThreshold(Algorithm algorithm);

ScoreKind scoreKindOf(Algorithm algorithm);

// accepted = score && *score >= threshold
void applyThreshold(std::vector<MatchResult>& results, double threshold);

} // namespace matching
