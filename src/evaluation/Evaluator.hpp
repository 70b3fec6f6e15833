#pragma once

#include "Metrics.hpp"
#include "data/Table.hpp"
#include "matching/MatchTypes.hpp"

#include <string>
#include <vector>

namespace data
{
class ValidationStore;
}

namespace evaluation
{

enum class PairStatus
{
    Evaluated,
    MissingColumns,  // <ALGO>_TRUE_MATCH or <ALGO>_BEST_MATCH_BINARY absent
    NoLabelledRows,  // every row lacks a label or a prediction
    InvalidLabels    // a label outside {0, 1} after coercion
};

const char* pairStatusName(PairStatus status);

struct AlgorithmEvaluation
{
    matching::Algorithm algorithm = matching::Algorithm::Levenshtein;
    PairStatus status = PairStatus::MissingColumns;
    std::string detail;
    std::size_t rows_used = 0;
    ConfusionMatrix confusion;
    MetricSet metrics;

    bool evaluated() const { return status == PairStatus::Evaluated; }
};

struct DatasetEvaluation
{
    std::string dataset;
    std::size_t rows = 0;
    std::vector<AlgorithmEvaluation> algorithms; // One entry per requested algorithm, in request order

    std::size_t evaluatedCount() const;
};

/**
 * @brief Scores validated match results per (dataset, algorithm) pair.
 *
 * A pair that cannot be scored is recorded with its PairStatus, reported as
 * an Evaluation warning and skipped; other pairs are unaffected.
 */
class Evaluator
{
public:
    explicit Evaluator(std::vector<matching::Algorithm> algorithms);
    Evaluator();

    const std::vector<matching::Algorithm>& algorithms() const { return algorithms_; }

    AlgorithmEvaluation evaluateAlgorithm(const data::Table& validated, matching::Algorithm algorithm,
                                          const std::string& dataset = {}) const;

    DatasetEvaluation evaluate(const std::string& dataset, const data::Table& validated) const;

    // Rows = kMetricNames, one column per evaluated algorithm (lowercase name)
    static data::Table metricsTable(const DatasetEvaluation& evaluation);

    // Rows "True Negative"/"True Positive", columns "Predicted Negative"/"Predicted Positive"
    static data::Table confusionTable(const ConfusionMatrix& matrix);

    /**
     * @brief Loads, evaluates and exports every dataset.
     * @return number of datasets for which a metrics table was written
     */
    std::size_t run(const data::ValidationStore& store, const std::vector<std::string>& datasets) const;

private:
    std::vector<matching::Algorithm> algorithms_;
};

} // namespace evaluation
