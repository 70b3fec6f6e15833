#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "TestHelpers.hpp"
#include "evaluation/Evaluator.hpp"
#include "data/Csv.hpp"
#include "data/ValidationStore.hpp"
#include "utils/ErrorReporter.hpp"

using namespace evaluation;
using matching::Algorithm;
using test_helpers::TempDir;
using test_helpers::writeFile;
using Catch::Matchers::WithinAbs;

namespace
{

data::Table validatedTable(std::vector<data::Cell> truth, std::vector<data::Cell> predicted)
{
    data::Table table;
    table.addColumn("LEVENSHTEIN_TRUE_MATCH", std::move(truth));
    table.addColumn("LEVENSHTEIN_BEST_MATCH_BINARY", std::move(predicted));
    return table;
}

} // namespace

TEST_CASE("Evaluator - scores a validated algorithm", "[evaluator]")
{
    utils::ErrorReporter::ClearErrors();
    Evaluator evaluator({ Algorithm::Levenshtein });
    auto table = validatedTable({ "1", "1", "0", "0" }, { "True", "False", "False", "False" });

    AlgorithmEvaluation result = evaluator.evaluateAlgorithm(table, Algorithm::Levenshtein, "STREET");
    REQUIRE(result.evaluated());
    REQUIRE(result.rows_used == 4);
    REQUIRE(result.confusion.true_positive == 1);
    REQUIRE(result.confusion.false_negative == 1);
    REQUIRE_THAT(result.metrics.accuracy, WithinAbs(0.75, 1e-12));
    REQUIRE_THAT(*result.metrics.roc_auc, WithinAbs(0.75, 1e-12));
    REQUIRE_FALSE(utils::ErrorReporter::HasPendingErrors());
}

TEST_CASE("Evaluator - rows without a label are filtered out", "[evaluator]")
{
    Evaluator evaluator({ Algorithm::Levenshtein });
    auto full = validatedTable({ "1", "0", "1" }, { "1", "1", "0" });
    auto half = validatedTable({ "1", std::nullopt, "0", "1", std::nullopt },
                               { "1", "1", "1", "0", std::nullopt });

    auto a = evaluator.evaluateAlgorithm(full, Algorithm::Levenshtein);
    auto b = evaluator.evaluateAlgorithm(half, Algorithm::Levenshtein);

    REQUIRE(b.evaluated());
    REQUIRE(b.rows_used == 3);
    REQUIRE(a.metrics.accuracy == b.metrics.accuracy);
    REQUIRE(a.metrics.f1 == b.metrics.f1);
    REQUIRE(a.metrics.roc_auc == b.metrics.roc_auc);
}

TEST_CASE("Evaluator - pairs that cannot be scored are skipped", "[evaluator]")
{
    utils::ErrorReporter::ClearErrors();
    Evaluator evaluator({ Algorithm::Levenshtein, Algorithm::Dice });

    SECTION("Missing columns")
    {
        auto result = evaluator.evaluateAlgorithm(validatedTable({ "1" }, { "1" }), Algorithm::Dice);
        REQUIRE(result.status == PairStatus::MissingColumns);
        REQUIRE_FALSE(result.evaluated());
    }

    SECTION("Invalid label")
    {
        auto result = evaluator.evaluateAlgorithm(validatedTable({ "1", "2" }, { "1", "0" }), Algorithm::Levenshtein);
        REQUIRE(result.status == PairStatus::InvalidLabels);
    }

    SECTION("No labelled rows")
    {
        auto result = evaluator.evaluateAlgorithm(validatedTable({ std::nullopt, std::nullopt }, { "1", "0" }),
                                                  Algorithm::Levenshtein);
        REQUIRE(result.status == PairStatus::NoLabelledRows);
    }

    SECTION("Other algorithms of the dataset still evaluate")
    {
        auto evaluation = evaluator.evaluate("STREET", validatedTable({ "1", "0" }, { "1", "0" }));
        REQUIRE(evaluation.rows == 2);
        REQUIRE(evaluation.algorithms.size() == 2);
        REQUIRE(evaluation.algorithms[0].evaluated());
        REQUIRE(evaluation.algorithms[1].status == PairStatus::MissingColumns);
        REQUIRE(evaluation.evaluatedCount() == 1);
    }

    auto errors = utils::ErrorReporter::GetPendingErrors();
    for (const auto& error : errors)
        REQUIRE(error.category == utils::ErrorCategory::Evaluation);
}

TEST_CASE("Evaluator - metrics table layout", "[evaluator]")
{
    Evaluator evaluator({ Algorithm::Levenshtein, Algorithm::Dice });
    auto evaluation = evaluator.evaluate("STREET", validatedTable({ "1", "1", "1" }, { "1", "0", "1" }));
    data::Table table = Evaluator::metricsTable(evaluation);

    REQUIRE(table.rowCount() == kMetricNames.size());
    REQUIRE(table.index()[0] == "Accuracy");
    REQUIRE(table.index()[4] == "ROC-AUC");
    REQUIRE(table.columnNames() == std::vector<std::string>{ "levenshtein" });
    REQUIRE(table.cell(0, "levenshtein").has_value());
    REQUIRE_FALSE(table.cell(4, "levenshtein").has_value());
}

TEST_CASE("Evaluator - confusion table layout", "[evaluator]")
{
    ConfusionMatrix m;
    m.true_negative = 4;
    m.false_positive = 3;
    m.false_negative = 2;
    m.true_positive = 1;
    data::Table table = Evaluator::confusionTable(m);

    REQUIRE(table.index() == std::vector<std::string>{ "True Negative", "True Positive" });
    REQUIRE(table.cell(0, "Predicted Negative") == "4");
    REQUIRE(table.cell(0, "Predicted Positive") == "3");
    REQUIRE(table.cell(1, "Predicted Negative") == "2");
    REQUIRE(table.cell(1, "Predicted Positive") == "1");
}

TEST_CASE("Evaluator - run loads, scores and exports each dataset", "[evaluator]")
{
    utils::ErrorReporter::ClearErrors();
    TempDir dir;
    const auto validation = dir.path() / "validation";
    const auto output = dir.path() / "evaluation";

    writeFile(validation / "customers_2024" / "STREET" / "validated" / "a.csv",
              ";MATCH;LEVENSHTEIN_TRUE_MATCH;LEVENSHTEIN_BEST_MATCH_BINARY\n"
              "0;Goethe Str.;1;True\n"
              "1;Unter der Buche;0;False\n"
              "2;Schlossstr.;1;False\n");

    data::ValidationStore store(validation, output);
    Evaluator evaluator({ Algorithm::Levenshtein });

    REQUIRE(evaluator.run(store, { "STREET", "FULLNAME" }) == 1);

    const auto results = output / (utils::ErrorReporter::GetDate() + "_STREET_eval_results.csv");
    REQUIRE(std::filesystem::exists(results));
    REQUIRE(std::filesystem::exists(output / "confusion_matrices" / "levenshtein_STREET_confusion_matrix.csv"));
    REQUIRE_FALSE(std::filesystem::exists(output / "confusion_matrices" / "levenshtein_FULLNAME_confusion_matrix.csv"));

    data::Table metrics = data::readCsv(results);
    REQUIRE(metrics.hasColumn("levenshtein"));
    REQUIRE(metrics.cell(0, "levenshtein") == "0.666666666666667");
    utils::ErrorReporter::ClearErrors();
}
