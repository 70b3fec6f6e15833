#include "Evaluator.hpp"

#include "data/ValidationStore.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/Profile.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace evaluation
{

namespace
{

std::string formatMetric(double value)
{
    std::ostringstream out;
    out << std::setprecision(15) << value;
    return out.str();
}

void reportSkipped(const std::string& dataset, const AlgorithmEvaluation& result)
{
    PLOG_WARNING << "[" << dataset << "] " << matching::algorithmName(result.algorithm) << " skipped ("
                 << pairStatusName(result.status) << "): " << result.detail;
    utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Evaluation,
                                        std::string("Evaluation skipped: ") + pairStatusName(result.status),
                                        "dataset=" + dataset + " algorithm=" +
                                            matching::algorithmName(result.algorithm) + " " + result.detail);
}

} // namespace

const char* pairStatusName(PairStatus status)
{
    switch (status)
    {
    case PairStatus::Evaluated:
        return "evaluated";
    case PairStatus::MissingColumns:
        return "missing columns";
    case PairStatus::NoLabelledRows:
        return "no labelled rows";
    case PairStatus::InvalidLabels:
        return "invalid labels";
    default:
        return "unknown";
    }
}

std::size_t DatasetEvaluation::evaluatedCount() const
{
    return static_cast<std::size_t>(
        std::count_if(algorithms.begin(), algorithms.end(), [](const auto& a) { return a.evaluated(); }));
}

Evaluator::Evaluator(std::vector<matching::Algorithm> algorithms) : algorithms_(std::move(algorithms)) {}

Evaluator::Evaluator()
    : algorithms_(matching::allAlgorithms().begin(), matching::allAlgorithms().end())
{
}

AlgorithmEvaluation Evaluator::evaluateAlgorithm(const data::Table& validated, matching::Algorithm algorithm,
                                                 const std::string& dataset) const
{
    AlgorithmEvaluation result;
    result.algorithm = algorithm;

    const std::string prefix = matching::algorithmLabel(algorithm) + "_";
    const std::string truth_column = prefix + "TRUE_MATCH";
    const std::string predicted_column = prefix + "BEST_MATCH_BINARY";

    if (!validated.hasColumn(truth_column) || !validated.hasColumn(predicted_column))
    {
        result.status = PairStatus::MissingColumns;
        result.detail = "need " + truth_column + " and " + predicted_column;
        reportSkipped(dataset, result);
        return result;
    }

    const auto& truth_cells = validated.column(truth_column);
    const auto& predicted_cells = validated.column(predicted_column);

    std::vector<bool> truth;
    std::vector<bool> predicted;
    for (std::size_t r = 0; r < validated.rowCount(); ++r)
    {
        if (!truth_cells[r] || !predicted_cells[r])
            continue;

        auto t = parseLabel(*truth_cells[r]);
        auto p = parseLabel(*predicted_cells[r]);
        if (!t || !p)
        {
            result.status = PairStatus::InvalidLabels;
            result.detail = "row " + validated.index()[r] + ": '" + (t ? *predicted_cells[r] : *truth_cells[r]) +
                            "' is not a binary label";
            reportSkipped(dataset, result);
            return result;
        }
        truth.push_back(*t);
        predicted.push_back(*p);
    }

    if (truth.empty())
    {
        result.status = PairStatus::NoLabelledRows;
        result.detail = "no row has both a label and a prediction";
        reportSkipped(dataset, result);
        return result;
    }

    result.status = PairStatus::Evaluated;
    result.rows_used = truth.size();
    result.confusion = computeConfusion(truth, predicted);
    result.metrics = computeMetrics(result.confusion);

    PLOG_INFO << "[" << dataset << "] " << matching::algorithmName(algorithm) << " rows=" << result.rows_used
              << " accuracy=" << result.metrics.accuracy << " f1=" << result.metrics.f1;
    if (!result.metrics.roc_auc)
    {
        PLOG_WARNING << "[" << dataset << "] " << matching::algorithmName(algorithm)
                     << " ROC-AUC undefined, ground truth has a single class";
    }
    return result;
}

DatasetEvaluation Evaluator::evaluate(const std::string& dataset, const data::Table& validated) const
{
    PROFILE_SCOPE_FUNCTION();

    DatasetEvaluation evaluation;
    evaluation.dataset = dataset;
    evaluation.rows = validated.rowCount();
    evaluation.algorithms.reserve(algorithms_.size());
    for (auto algorithm : algorithms_)
        evaluation.algorithms.push_back(evaluateAlgorithm(validated, algorithm, dataset));
    return evaluation;
}

data::Table Evaluator::metricsTable(const DatasetEvaluation& evaluation)
{
    data::Table table;
    for (const char* metric : kMetricNames)
        table.appendRow(metric, {});

    for (const auto& result : evaluation.algorithms)
    {
        if (!result.evaluated())
            continue;

        std::vector<data::Cell> cells;
        for (const auto& value : result.metrics.values())
            cells.push_back(value ? data::Cell(formatMetric(*value)) : std::nullopt);
        table.addColumn(matching::algorithmName(result.algorithm), std::move(cells));
    }
    return table;
}

data::Table Evaluator::confusionTable(const ConfusionMatrix& matrix)
{
    data::Table table;
    table.appendRow("True Negative", {});
    table.appendRow("True Positive", {});
    table.addColumn("Predicted Negative", { std::to_string(matrix.true_negative), std::to_string(matrix.false_negative) });
    table.addColumn("Predicted Positive", { std::to_string(matrix.false_positive), std::to_string(matrix.true_positive) });
    return table;
}

std::size_t Evaluator::run(const data::ValidationStore& store, const std::vector<std::string>& datasets) const
{
    std::size_t exported = 0;
    for (const auto& dataset : datasets)
    {
        const data::Table validated = store.loadValidated(dataset);
        if (validated.rowCount() == 0)
        {
            PLOG_WARNING << "No validated data found for dataset '" << dataset << "', skipping";
            continue;
        }

        const DatasetEvaluation evaluation = evaluate(dataset, validated);
        if (evaluation.evaluatedCount() == 0)
        {
            PLOG_WARNING << "No algorithm could be evaluated on dataset '" << dataset << "', skipping";
            continue;
        }

        try
        {
            auto path = store.exportEvaluation(metricsTable(evaluation), dataset);
            PLOG_INFO << "Wrote metrics for " << dataset << " to " << path.string();
            ++exported;

            for (const auto& result : evaluation.algorithms)
            {
                if (result.evaluated())
                    store.exportConfusionMatrix(confusionTable(result.confusion),
                                                matching::algorithmName(result.algorithm), dataset);
            }
        }
        catch (const std::exception& ex)
        {
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Export, "Evaluation export failed",
                                              "dataset=" + dataset + ": " + ex.what());
        }
    }
    return exported;
}

} // namespace evaluation
