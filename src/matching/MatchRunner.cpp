#include "MatchRunner.hpp"

#include "processing/Diagnostics.hpp"
#include "processing/StageRunner.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/Profile.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <chrono>
#include <optional>
#include <stdexcept>
#include <utility>

namespace matching
{

using processing::StageResult;
using processing::run_stage;

std::size_t MatchTable::acceptedCount() const
{
    return static_cast<std::size_t>(
        std::count_if(rows.begin(), rows.end(), [](const MatchResult& r) { return r.accepted.value_or(false); }));
}

std::string MatchTable::rowLabel(const MatchResult& row) const
{
    if (row.query_index < query_labels.size())
        return query_labels[row.query_index];
    return std::to_string(row.query_index);
}

namespace
{

double checkedThreshold(double threshold)
{
    if (!(threshold >= 0.0 && threshold <= 1.0))
        throw std::invalid_argument("threshold must be within [0, 1], got " + std::to_string(threshold));
    return threshold;
}

StageResult<MatchTable> failRun(const std::string& stage, const std::optional<std::string>& error,
                                std::chrono::microseconds elapsed)
{
    return StageResult<MatchTable>::failure(error.value_or("unknown error"), elapsed, stage);
}

} // namespace

MatchRunner::MatchRunner(Algorithm algorithm, double threshold, std::size_t max_workers, MatcherOptions options)
    : factory_([algorithm, options]() { return createMatcher(algorithm, options); })
    , threshold_(checkedThreshold(threshold))
    , pool_(max_workers)
{
}

MatchRunner::MatchRunner(MatcherFactory factory, double threshold, std::size_t max_workers)
    : factory_(std::move(factory))
    , threshold_(checkedThreshold(threshold))
    , pool_(max_workers)
{
    if (!factory_)
        throw std::invalid_argument("MatchRunner requires a matcher factory");
}

StageResult<MatchTable> MatchRunner::run(const std::vector<data::Cell>& reference,
                                         const std::vector<data::Cell>& queries) const
{
    return execute(reference, queries, {});
}

StageResult<MatchTable> MatchRunner::run(const data::Table& reference, const std::string& reference_column,
                                         const data::Table& queries, const std::string& query_column) const
{
    auto missing = [](const data::Table& table, const std::string& column, const char* role)
    {
        if (table.hasColumn(column))
            return false;
        const std::string message = std::string(role) + " table has no column '" + column + "'";
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Input, "Missing match column", message);
        return true;
    };
    if (missing(reference, reference_column, "reference") || missing(queries, query_column, "query"))
        return StageResult<MatchTable>::failure("missing match column", std::chrono::microseconds{ 0 }, "input");

    return execute(reference.column(reference_column), queries.column(query_column), queries.index());
}

StageResult<MatchTable> MatchRunner::execute(const std::vector<data::Cell>& reference,
                                             const std::vector<data::Cell>& queries,
                                             std::vector<std::string> query_labels) const
{
    PROFILE_SCOPE_FUNCTION();
    using namespace std::chrono;
    const auto start = steady_clock::now();
    auto elapsed = [&start]() { return duration_cast<microseconds>(steady_clock::now() - start); };

    std::unique_ptr<IMatchAlgorithm> matcher = factory_();
    if (!matcher)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Matcher factory returned nothing");
        return StageResult<MatchTable>::failure("no matcher", elapsed(), "create");
    }
    const std::string name = matcher->name();

    auto normalized = run_stage<std::pair<Corpus, Corpus>>(name + ".normalize", [&]() {
        return std::make_pair(normalizer_.makeRecords(reference), normalizer_.makeRecords(queries));
    });
    if (!normalized.succeeded)
        return failRun(normalized.stage_name, normalized.error, elapsed());

    auto prepared = run_stage<bool>(name + ".prepare", [&]() {
        return matcher->prepare(normalized.result.first, normalized.result.second);
    });
    if (!prepared.succeeded)
        return failRun(prepared.stage_name, prepared.error, elapsed());

    auto searched = run_stage<SearchOutcome>(name + ".search", [&]() { return matcher->findMatches(pool_); });
    if (!searched.succeeded)
        return failRun(searched.stage_name, searched.error, elapsed());

    auto classified = run_stage<std::vector<MatchResult>>(name + ".classify", [&]() {
        std::vector<MatchResult> rows = std::move(searched.result.results);
        matcher->classify(rows, threshold_);
        return rows;
    });
    if (!classified.succeeded)
        return failRun(classified.stage_name, classified.error, elapsed());

    MatchTable table;
    table.algorithm = matcher->algorithm();
    table.algorithm_name = name;
    table.score_kind = matcher->scoreKind();
    table.threshold = threshold_;
    table.query_count = queries.size();
    table.rows = std::move(classified.result);
    table.failures = std::move(searched.result.failures);
    table.query_labels = std::move(query_labels);

    const auto duration = elapsed();
    PLOG_INFO << "[" << name << "] matched " << table.rows.size() << "/" << table.query_count
              << " queries against " << reference.size() << " references, accepted=" << table.acceptedCount()
              << " failures=" << table.failures.size() << " in " << duration.count() / 1000 << "ms";
    if (!prepared.result)
    {
        PLOG_WARNING << "[" << name << "] empty reference or query set, no query matched";
    }

    return StageResult<MatchTable>::success(std::move(table), duration, name);
}

} // namespace matching
