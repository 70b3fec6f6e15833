#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "matching/MatchAlgorithmBase.hpp"
#include "matching/MatchRunner.hpp"
#include "data/SampleData.hpp"
#include "utils/ErrorReporter.hpp"

#include <memory>
#include <stdexcept>

using namespace matching;
using data::Cell;
using utils::ErrorReporter;

namespace
{

// Scores every query 0.9 against reference 0, throws on "boom"
class FlakyMatcher : public MatchAlgorithmBase
{
public:
    Algorithm algorithm() const override { return Algorithm::Jaccard; }

protected:
    void onPrepare() override {}

    Candidate searchQuery(std::size_t query_index) const override
    {
        if (queries().at(query_index).normalized == "boom")
            throw std::runtime_error("scoring exploded");
        return Candidate{ 0, 0.9 };
    }
};

std::vector<Cell> cells(std::initializer_list<const char*> values)
{
    std::vector<Cell> out;
    for (const char* value : values)
    {
        if (value)
            out.emplace_back(value);
        else
            out.emplace_back(std::nullopt);
    }
    return out;
}

} // namespace

TEST_CASE("MatchRunner - levenshtein over the sample tables", "[runner]")
{
    ErrorReporter::ClearErrors();
    MatchRunner runner(Algorithm::Levenshtein, defaultThreshold(Algorithm::Levenshtein), 4);
    auto run = runner.run(data::sampleReference(), "STREET", data::sampleQueries(), "STREET");

    REQUIRE(run.succeeded);
    const MatchTable& table = run.result;
    REQUIRE(table.algorithm == Algorithm::Levenshtein);
    REQUIRE(table.algorithm_name == "levenshtein");
    REQUIRE(table.threshold == 0.8);
    REQUIRE(table.query_count == 5);
    REQUIRE(table.rows.size() == 5);
    REQUIRE(table.failures.empty());
    REQUIRE(table.rows[0].best_match == "Schloßstraße");
    REQUIRE(table.rows[0].accepted == true);
    REQUIRE(table.acceptedCount() == 4);
    REQUIRE(table.rowLabel(table.rows[2]) == "2");
}

TEST_CASE("MatchRunner - failing query is dropped and listed", "[runner]")
{
    ErrorReporter::ClearErrors();
    MatchRunner runner([]() { return std::make_unique<FlakyMatcher>(); }, 0.5, 2);
    auto run = runner.run(cells({ "anything" }), cells({ "first", "boom", "third" }));

    REQUIRE(run.succeeded);
    const MatchTable& table = run.result;
    REQUIRE(table.query_count == 3);
    REQUIRE(table.rows.size() == 2);
    REQUIRE(table.failures.size() == 1);
    REQUIRE(table.rows.size() == table.query_count - table.failures.size());

    REQUIRE(table.failures[0].query_index == 1);
    REQUIRE(table.failures[0].query == "boom");
    REQUIRE(table.failures[0].reason == "scoring exploded");

    REQUIRE(table.rows[0].query_index == 0);
    REQUIRE(table.rows[1].query_index == 2);
    REQUIRE(table.rows[1].best_match == "anything");
    REQUIRE(table.rows[1].accepted == true);

    REQUIRE(ErrorReporter::HasPendingErrors());
    ErrorReporter::ClearErrors();
}

TEST_CASE("MatchRunner - row labels follow the query table", "[runner]")
{
    data::Table reference;
    reference.addColumn("STREET", cells({ "Goethestraße", "Am Markt" }));

    data::Table queries("ID");
    queries.addColumn("STREET", {});
    queries.appendRow("a17", cells({ "Am Markt" }));
    queries.appendRow("b03", cells({ "Goethestr." }));

    MatchRunner runner(Algorithm::Jaccard, 0.5);
    auto run = runner.run(reference, "STREET", queries, "STREET");

    REQUIRE(run.succeeded);
    REQUIRE(run.result.query_labels.size() == 2);
    REQUIRE(run.result.rowLabel(run.result.rows[0]) == "a17");
    REQUIRE(run.result.rowLabel(run.result.rows[1]) == "b03");
    REQUIRE(run.result.rows[0].best_match == "Am Markt");
}

TEST_CASE("MatchRunner - missing cells become empty queries", "[runner]")
{
    MatchRunner runner(Algorithm::Dice, 0.5);
    auto run = runner.run(cells({ "Lindenweg" }), cells({ nullptr, "Lindenweg" }));

    REQUIRE(run.succeeded);
    REQUIRE(run.result.rows.size() == 2);
    REQUIRE(run.result.rows[0].query.empty());
    REQUIRE_FALSE(run.result.rows[0].score.has_value());
    REQUIRE(run.result.rows[0].accepted == false);
    REQUIRE_THAT(*run.result.rows[1].score, Catch::Matchers::WithinAbs(1.0, 1e-9));
}

TEST_CASE("MatchRunner - missing column fails the run", "[runner]")
{
    ErrorReporter::ClearErrors();
    MatchRunner runner(Algorithm::Levenshtein, 0.8);
    auto run = runner.run(data::sampleReference(), "FULLNAME", data::sampleQueries(), "STREET");

    REQUIRE_FALSE(run.succeeded);
    REQUIRE(run.stage_name == "input");
    REQUIRE(run.error.has_value());

    auto errors = ErrorReporter::GetPendingErrors();
    REQUIRE_FALSE(errors.empty());
    REQUIRE(errors.back().category == utils::ErrorCategory::Input);
}

TEST_CASE("MatchRunner - empty reference reports no match for every query", "[runner]")
{
    ErrorReporter::ClearErrors();
    MatchRunner runner(Algorithm::Tfidf, 0.5);
    auto run = runner.run({}, cells({ "Goethe Str.", "Am Markt" }));

    REQUIRE(run.succeeded);
    REQUIRE(run.result.rows.size() == 2);
    REQUIRE(run.result.acceptedCount() == 0);
    for (const auto& row : run.result.rows)
        REQUIRE_FALSE(row.best_match.has_value());
    ErrorReporter::ClearErrors();
}

TEST_CASE("MatchRunner - construction checks", "[runner]")
{
    REQUIRE_THROWS_AS(MatchRunner(Algorithm::Dice, 1.5), std::invalid_argument);
    REQUIRE_THROWS_AS(MatchRunner(Algorithm::Dice, -0.1), std::invalid_argument);
    REQUIRE_THROWS_AS(MatchRunner(MatchRunner::MatcherFactory{}, 0.5), std::invalid_argument);

    MatchRunner runner(Algorithm::Dice, 0.0, 3);
    REQUIRE(runner.threshold() == 0.0);
    REQUIRE(runner.workerCount() == 3);
}

TEST_CASE("MatchRunner - factory returning nothing fails at creation", "[runner]")
{
    ErrorReporter::ClearErrors();
    MatchRunner runner([]() { return std::unique_ptr<IMatchAlgorithm>(); }, 0.5);
    auto run = runner.run(cells({ "a" }), cells({ "a" }));

    REQUIRE_FALSE(run.succeeded);
    REQUIRE(run.stage_name == "create");
    ErrorReporter::ClearErrors();
}

TEST_CASE("MatchRunner - input columns are left untouched", "[runner]")
{
    const auto reference = cells({ "Schloßstraße", "Goethestr." });
    const auto queries = cells({ "Schlossstr." });
    const auto reference_copy = reference;
    const auto queries_copy = queries;

    MatchRunner runner(Algorithm::Regex, 0.5);
    auto run = runner.run(reference, queries);

    REQUIRE(run.succeeded);
    REQUIRE(run.result.score_kind == ScoreKind::Boolean);
    REQUIRE(run.result.rows[0].best_match == "Schloßstraße");
    REQUIRE(reference == reference_copy);
    REQUIRE(queries == queries_copy);
}
