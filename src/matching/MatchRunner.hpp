#pragma once

#include "IMatchAlgorithm.hpp"
#include "data/Table.hpp"
#include "processing/RecordNormalizer.hpp"
#include "processing/TextProcessingTypes.hpp"
#include "utils/WorkerPool.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace matching
{

/**
 * @brief Result table of one (reference, queries, algorithm) run.
 *
 * rows holds the successful queries in input order. A query whose scoring
 * failed has no row; it is listed in failures instead, so
 * rows.size() == query_count - failures.size().
 */
struct MatchTable
{
    Algorithm algorithm = Algorithm::Levenshtein;
    std::string algorithm_name;
    ScoreKind score_kind = ScoreKind::Continuous;
    double threshold = 0.0;
    std::size_t query_count = 0;
    std::vector<MatchResult> rows;
    std::vector<QueryFailure> failures;
    std::vector<std::string> query_labels; // Source row label per query index, empty for positional input

    std::size_t acceptedCount() const;

    // Source row label of a result, its query index when no labels were recorded
    std::string rowLabel(const MatchResult& row) const;
};

/**
 * @brief Runs normalize -> prepare -> search -> classify for one unit of work.
 *
 * Every run gets a fresh algorithm instance, so runners can be used from
 * several threads for different datasets. Input tables and columns are never
 * modified. A failing stage fails the run (StageResult::succeeded == false);
 * a failing query only drops that query.
 */
class MatchRunner
{
public:
    using MatcherFactory = std::function<std::unique_ptr<IMatchAlgorithm>()>;

    MatchRunner(Algorithm algorithm, double threshold, std::size_t max_workers = 0, MatcherOptions options = {});
    MatchRunner(MatcherFactory factory, double threshold, std::size_t max_workers = 0);

    [[nodiscard]] double threshold() const { return threshold_; }
    [[nodiscard]] std::size_t workerCount() const { return pool_.size(); }

    processing::StageResult<MatchTable> run(const std::vector<data::Cell>& reference,
                                            const std::vector<data::Cell>& queries) const;

    // Missing columns fail the run with an Input error
    processing::StageResult<MatchTable> run(const data::Table& reference, const std::string& reference_column,
                                            const data::Table& queries, const std::string& query_column) const;

private:
    processing::StageResult<MatchTable> execute(const std::vector<data::Cell>& reference,
                                                const std::vector<data::Cell>& queries,
                                                std::vector<std::string> query_labels) const;

    MatcherFactory factory_;
    double threshold_;
    utils::WorkerPool pool_;
    processing::RecordNormalizer normalizer_;
};

} // namespace matching
