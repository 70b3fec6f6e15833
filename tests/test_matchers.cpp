#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "TestHelpers.hpp"
#include "matching/IMatchAlgorithm.hpp"
#include "matching/NgramMatcher.hpp"
#include "utils/WorkerPool.hpp"

#include <stdexcept>

using namespace matching;
using Catch::Matchers::WithinAbs;
using test_helpers::corpusOf;

namespace
{

SearchOutcome search(IMatchAlgorithm& matcher, const Corpus& reference, const Corpus& queries)
{
    matcher.prepare(reference, queries);
    return matcher.findMatches(utils::WorkerPool(4));
}

Corpus sampleReference()
{
    return corpusOf({ "Schloßstraße", "Stockflethweg", "Über den Bergen", "Überlinger Str.", "Goethestraße",
                      "Bahnhofstrasse", "Musterstraße" });
}

Corpus sampleQueries()
{
    return corpusOf({ "Schlossstr.", "Ueberlinger Straße", "Unter der Buche", "Goethe Str.", "Stockfleterweg" });
}

} // namespace

TEST_CASE("Matcher factory - one implementation per algorithm", "[matching]")
{
    for (Algorithm algorithm : allAlgorithms())
    {
        auto matcher = createMatcher(algorithm);
        REQUIRE(matcher);
        REQUIRE(matcher->algorithm() == algorithm);
        REQUIRE(std::string(matcher->name()) == algorithmName(algorithm));
        REQUIRE(matcher->state() == MatchState::Unprepared);
    }

    REQUIRE(createMatcher(Algorithm::Regex)->scoreKind() == ScoreKind::Boolean);
    REQUIRE(createMatcher(Algorithm::Tfidf)->scoreKind() == ScoreKind::Continuous);
}

TEST_CASE("Matcher - algorithm names parse case-insensitively", "[matching]")
{
    REQUIRE(parseAlgorithm("LEVENSHTEIN") == Algorithm::Levenshtein);
    REQUIRE(parseAlgorithm("TfIdf") == Algorithm::Tfidf);
    REQUIRE_FALSE(parseAlgorithm("soundex").has_value());
    REQUIRE(algorithmLabel(Algorithm::Ngram) == "NGRAM");
    REQUIRE(defaultThreshold(Algorithm::Levenshtein) == 0.8);
    REQUIRE(defaultThreshold(Algorithm::Dice) == 0.5);
}

TEST_CASE("Matcher - lifecycle states", "[matching]")
{
    auto matcher = createMatcher(Algorithm::Jaccard);

    REQUIRE_THROWS_AS(matcher->matchQuery(0), std::logic_error);

    REQUIRE(matcher->prepare(corpusOf({ "a b" }), corpusOf({ "a" })));
    REQUIRE(matcher->state() == MatchState::Prepared);
    REQUIRE_THROWS_AS(matcher->matchQuery(5), std::out_of_range);

    auto outcome = matcher->findMatches(utils::WorkerPool(1));
    REQUIRE(matcher->state() == MatchState::Searched);

    matcher->classify(outcome.results, 0.5);
    REQUIRE(matcher->state() == MatchState::Classified);

    REQUIRE(matcher->prepare(corpusOf({ "c" }), corpusOf({ "c" })));
    REQUIRE(matcher->state() == MatchState::Prepared);
}

TEST_CASE("Matcher - search before prepare yields nothing", "[matching]")
{
    auto matcher = createMatcher(Algorithm::Dice);
    auto outcome = matcher->findMatches(utils::WorkerPool(2));
    REQUIRE(outcome.results.empty());
    REQUIRE(outcome.failures.empty());
    REQUIRE(matcher->state() == MatchState::Unprepared);
}

TEST_CASE("Levenshtein - abbreviated street reaches the threshold", "[matching]")
{
    auto matcher = createMatcher(Algorithm::Levenshtein);
    auto outcome = search(*matcher, corpusOf({ "Schlossstrasse", "Goethestrasse" }), corpusOf({ "Schlossstr." }));
    matcher->classify(outcome.results, 0.8);

    REQUIRE(outcome.results.size() == 1);
    const auto& result = outcome.results[0];
    REQUIRE(result.best_match == "Schlossstrasse");
    REQUIRE(result.best_match_index == 0u);
    REQUIRE(result.score.value() >= 0.8);
    REQUIRE(result.accepted == true);
}

TEST_CASE("Levenshtein - sample streets find their counterparts", "[matching]")
{
    auto matcher = createMatcher(Algorithm::Levenshtein);
    auto outcome = search(*matcher, sampleReference(), sampleQueries());
    matcher->classify(outcome.results, 0.8);

    REQUIRE(outcome.results.size() == 5);
    REQUIRE(outcome.results[0].best_match == "Schloßstraße");
    REQUIRE_THAT(*outcome.results[0].score, WithinAbs(1.0, 1e-9));
    REQUIRE(outcome.results[1].best_match == "Überlinger Str.");
    REQUIRE(outcome.results[3].best_match == "Goethestraße");
    REQUIRE_THAT(*outcome.results[3].score, WithinAbs(1.0 - 1.0 / 14.0, 1e-9));
    REQUIRE(outcome.results[4].best_match == "Stockflethweg");
    REQUIRE(outcome.results[3].accepted == true);
    REQUIRE(outcome.results[4].accepted == true);

    for (std::size_t i = 0; i < outcome.results.size(); ++i)
        REQUIRE(outcome.results[i].query_index == i);
}

TEST_CASE("Matcher - empty query reports no match for every algorithm", "[matching]")
{
    for (Algorithm algorithm : allAlgorithms())
    {
        INFO("algorithm " << algorithmName(algorithm));
        auto matcher = createMatcher(algorithm);
        auto outcome = search(*matcher, corpusOf({ "Müllerweg" }), corpusOf({ "" }));
        matcher->classify(outcome.results, defaultThreshold(algorithm));

        REQUIRE(outcome.results.size() == 1);
        const auto& result = outcome.results[0];
        REQUIRE_FALSE(result.best_match.has_value());
        REQUIRE_FALSE(result.score.has_value());
        REQUIRE(result.accepted == false);
    }
}

TEST_CASE("Matcher - punctuation-only query counts as empty", "[matching]")
{
    auto matcher = createMatcher(Algorithm::Levenshtein);
    auto outcome = search(*matcher, corpusOf({ "Weg" }), corpusOf({ "--.." }));
    REQUIRE(outcome.results.size() == 1);
    REQUIRE(outcome.results[0].query == "--..");
    REQUIRE_FALSE(outcome.results[0].score.has_value());
}

TEST_CASE("Matcher - empty reference degrades to no match", "[matching]")
{
    for (Algorithm algorithm : allAlgorithms())
    {
        INFO("algorithm " << algorithmName(algorithm));
        auto matcher = createMatcher(algorithm);
        REQUIRE_FALSE(matcher->prepare({}, corpusOf({ "Goethe Str.", "Weg" })));

        auto outcome = matcher->findMatches(utils::WorkerPool(2));
        matcher->classify(outcome.results, 0.0);
        REQUIRE(outcome.results.size() == 2);
        for (const auto& result : outcome.results)
        {
            REQUIRE_FALSE(result.best_match.has_value());
            REQUIRE_FALSE(result.score.has_value());
            REQUIRE(result.accepted == false);
        }
    }
}

TEST_CASE("Matcher - a prepare with data clears an earlier empty run", "[matching]")
{
    for (Algorithm algorithm : allAlgorithms())
    {
        INFO("algorithm " << algorithmName(algorithm));
        auto matcher = createMatcher(algorithm);
        REQUIRE_FALSE(matcher->prepare({}, corpusOf({ "Goethe Str." })));
        REQUIRE(matcher->prepare(corpusOf({ "Goethe Str." }), corpusOf({ "Goethe Str." })));

        auto outcome = matcher->findMatches(utils::WorkerPool(1));
        REQUIRE(outcome.results.size() == 1);
        REQUIRE(outcome.results[0].best_match_index == std::optional<std::size_t>(0));
        REQUIRE(outcome.results[0].best_match == std::optional<std::string>("Goethe Str."));
    }
}

TEST_CASE("Jaccard - shared token over the token union", "[matching]")
{
    auto matcher = createMatcher(Algorithm::Jaccard);
    auto outcome = search(*matcher, corpusOf({ "Hauptstraße 1" }), corpusOf({ "Hauptstrasse Eins" }));

    REQUIRE(outcome.results.size() == 1);
    REQUIRE(outcome.results[0].best_match == "Hauptstraße 1");
    REQUIRE_THAT(*outcome.results[0].score, WithinAbs(1.0 / 3.0, 1e-9));
}

TEST_CASE("Jaccard - identical normalized text scores 1", "[matching]")
{
    auto matcher = createMatcher(Algorithm::Jaccard);
    auto outcome = search(*matcher, corpusOf({ "Am Markt", "Schloßstraße 5" }), corpusOf({ "Schlossstr. 5" }));
    REQUIRE(outcome.results[0].best_match_index == 1u);
    REQUIRE_THAT(*outcome.results[0].score, WithinAbs(1.0, 1e-9));
}

TEST_CASE("Matcher - ties keep the first reference", "[matching]")
{
    for (Algorithm algorithm : allAlgorithms())
    {
        INFO("algorithm " << algorithmName(algorithm));
        auto matcher = createMatcher(algorithm);
        auto outcome = search(*matcher, corpusOf({ "Zeppelinstr.", "Am Hafen", "am hafen" }), corpusOf({ "Am Hafen" }));
        REQUIRE(outcome.results[0].best_match_index == 1u);
    }
}

TEST_CASE("Matcher - no overlap still reports the first reference with score 0", "[matching]")
{
    auto matcher = createMatcher(Algorithm::Jaccard);
    auto outcome = search(*matcher, corpusOf({ "alpha", "beta" }), corpusOf({ "gamma" }));
    REQUIRE(outcome.results[0].best_match_index == 0u);
    REQUIRE(outcome.results[0].score == 0.0);
}

TEST_CASE("Dice - bigram overlap picks the closest spelling", "[matching]")
{
    auto matcher = createMatcher(Algorithm::Dice);
    auto outcome = search(*matcher, corpusOf({ "nacht", "night" }), corpusOf({ "nicht" }));
    // ni ic ch ht: shares ch ht with nacht, ni ht with night; tie keeps nacht
    REQUIRE(outcome.results[0].best_match == "nacht");
    REQUIRE_THAT(*outcome.results[0].score, WithinAbs(2.0 * 2.0 / 8.0, 1e-9));
}

TEST_CASE("N-gram - configurable window and short queries", "[matching]")
{
    SECTION("Trigrams through the factory options")
    {
        MatcherOptions options;
        options.ngram_size = 3;
        auto matcher = createMatcher(Algorithm::Ngram, options);
        auto* ngram = dynamic_cast<NgramMatcher*>(matcher.get());
        REQUIRE(ngram != nullptr);
        REQUIRE(ngram->ngramSize() == 3);

        auto outcome = search(*matcher, corpusOf({ "abcd" }), corpusOf({ "abc" }));
        REQUIRE_THAT(*outcome.results[0].score, WithinAbs(0.5, 1e-9));
    }

    SECTION("A query shorter than n has no features and no match")
    {
        auto matcher = createMatcher(Algorithm::Ngram);
        auto outcome = search(*matcher, corpusOf({ "a", "ab" }), corpusOf({ "a" }));
        REQUIRE_FALSE(outcome.results[0].best_match.has_value());
        REQUIRE_FALSE(outcome.results[0].score.has_value());
    }

    SECTION("Zero window size is rejected")
    {
        REQUIRE_THROWS_AS(NgramMatcher(0), std::invalid_argument);
    }
}

TEST_CASE("TF-IDF - cosine prefers records sharing more weighted terms", "[matching]")
{
    auto matcher = createMatcher(Algorithm::Tfidf);
    auto outcome = search(*matcher, corpusOf({ "Bahnhof Straße", "Goethe Straße 5", "Goethe Straße" }),
                          corpusOf({ "Goethe Str.", "Ringweg" }));

    REQUIRE(outcome.results[0].best_match == "Goethe Straße");
    REQUIRE_THAT(*outcome.results[0].score, WithinAbs(1.0, 1e-9));

    // no shared token: every cosine is 0, first reference wins
    REQUIRE(outcome.results[1].best_match_index == 0u);
    REQUIRE_THAT(*outcome.results[1].score, WithinAbs(0.0, 1e-12));
}

TEST_CASE("Containment - first containing reference wins with a boolean score", "[matching]")
{
    auto matcher = createMatcher(Algorithm::Regex);
    auto outcome = search(*matcher, corpusOf({ "Hauptstraße", "", "Schloßstraße 5", "Schloßstraße" }),
                          corpusOf({ "Schlossstr.", "Unter der Buche" }));
    matcher->classify(outcome.results, defaultThreshold(Algorithm::Regex));

    REQUIRE(outcome.results[0].best_match == "Schloßstraße 5");
    REQUIRE(outcome.results[0].score == 1.0);
    REQUIRE(outcome.results[0].accepted == true);

    REQUIRE_FALSE(outcome.results[1].best_match.has_value());
    REQUIRE(outcome.results[1].score == 0.0);
    REQUIRE(outcome.results[1].accepted == false);
}

TEST_CASE("Matcher - scores stay within [0, 1] on the sample streets", "[matching]")
{
    for (Algorithm algorithm : allAlgorithms())
    {
        INFO("algorithm " << algorithmName(algorithm));
        auto matcher = createMatcher(algorithm);
        auto outcome = search(*matcher, sampleReference(), sampleQueries());
        REQUIRE(outcome.results.size() == 5);
        REQUIRE(outcome.failures.empty());
        for (const auto& result : outcome.results)
        {
            REQUIRE(result.score.has_value());
            REQUIRE(*result.score >= 0.0);
            REQUIRE(*result.score <= 1.0);
        }
    }
}

TEST_CASE("Matcher - raising the threshold never accepts more", "[matching]")
{
    for (Algorithm algorithm : allAlgorithms())
    {
        INFO("algorithm " << algorithmName(algorithm));
        auto matcher = createMatcher(algorithm);
        auto outcome = search(*matcher, sampleReference(), sampleQueries());

        std::size_t previous = outcome.results.size() + 1;
        for (double threshold : { 0.0, 0.2, 0.4, 0.6, 0.8, 1.0 })
        {
            matcher->classify(outcome.results, threshold);
            std::size_t accepted = 0;
            for (const auto& result : outcome.results)
                accepted += result.accepted.value_or(false) ? 1 : 0;
            REQUIRE(accepted <= previous);
            previous = accepted;
        }
    }
}

TEST_CASE("Matcher - a second prepare replaces the vocabulary", "[matching]")
{
    const Corpus reference = corpusOf({ "Lindenallee", "Am Ring" });
    const Corpus queries = corpusOf({ "Linden Allee", "Ring" });

    for (Algorithm algorithm : { Algorithm::Jaccard, Algorithm::Dice, Algorithm::Ngram, Algorithm::Tfidf })
    {
        INFO("algorithm " << algorithmName(algorithm));
        auto reused = createMatcher(algorithm);
        search(*reused, corpusOf({ "ganz anderer Text", "noch mehr" }), corpusOf({ "Text" }));
        auto second = search(*reused, reference, queries);

        auto fresh = createMatcher(algorithm);
        auto expected = search(*fresh, reference, queries);

        REQUIRE(second.results.size() == expected.results.size());
        for (std::size_t i = 0; i < expected.results.size(); ++i)
        {
            REQUIRE(second.results[i].best_match_index == expected.results[i].best_match_index);
            REQUIRE_THAT(second.results[i].score.value_or(-1.0), WithinAbs(expected.results[i].score.value_or(-1.0), 1e-12));
        }
    }
}

TEST_CASE("Matcher - parallel search equals sequential search", "[matching]")
{
    for (Algorithm algorithm : allAlgorithms())
    {
        INFO("algorithm " << algorithmName(algorithm));
        auto matcher = createMatcher(algorithm);
        matcher->prepare(sampleReference(), sampleQueries());
        auto parallel = matcher->findMatches(utils::WorkerPool(8));
        auto sequential = matcher->findMatches(utils::WorkerPool(1));

        REQUIRE(parallel.results.size() == sequential.results.size());
        for (std::size_t i = 0; i < parallel.results.size(); ++i)
        {
            REQUIRE(parallel.results[i].query_index == sequential.results[i].query_index);
            REQUIRE(parallel.results[i].best_match == sequential.results[i].best_match);
            REQUIRE(parallel.results[i].score == sequential.results[i].score);
        }
    }
}
