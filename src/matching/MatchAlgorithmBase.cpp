#include "MatchAlgorithmBase.hpp"

#include "processing/Diagnostics.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/WorkerPool.hpp"

#include <plog/Log.h>

#include <stdexcept>
#include <string>

namespace matching
{

using processing::Diagnostics;

bool MatchAlgorithmBase::prepare(const Corpus& reference, const Corpus& queries)
{
    onReset();
    reference_ = reference;
    queries_ = queries;
    degraded_ = reference_.empty() || queries_.empty();
    state_ = MatchState::Prepared;

    if (degraded_)
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Input, "Empty input, every query reports no match",
                                            std::string("algorithm=") + name() +
                                                " reference=" + std::to_string(reference_.size()) +
                                                " queries=" + std::to_string(queries_.size()));
        return false;
    }

    onPrepare();

    if (Diagnostics::IsVerbose())
    {
        PLOG_INFO_(Diagnostics::kLogInstance) << "[" << name() << "] prepared reference=" << reference_.size()
                                              << " queries=" << queries_.size();
    }
    return true;
}

MatchResult MatchAlgorithmBase::matchQuery(std::size_t query_index) const
{
    if (state_ == MatchState::Unprepared)
        throw std::logic_error(std::string(name()) + ": matchQuery before prepare");
    if (query_index >= queries_.size())
        throw std::out_of_range(std::string(name()) + ": query index " + std::to_string(query_index) +
                                " out of range");

    const auto& query = queries_[query_index];

    MatchResult result;
    result.query_index = query_index;
    result.query = query.original;

    if (degraded_ || query.blank())
        return result;

    Candidate candidate = searchQuery(query_index);
    result.score = candidate.score;
    if (candidate.reference_index)
    {
        result.best_match_index = candidate.reference_index;
        result.best_match = reference_.at(*candidate.reference_index).original;
    }
    return result;
}

SearchOutcome MatchAlgorithmBase::findMatches(const utils::WorkerPool& pool)
{
    SearchOutcome outcome;
    if (state_ == MatchState::Unprepared)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Matching, "Search requested before prepare",
                                          std::string("algorithm=") + name());
        return outcome;
    }

    auto tasks = pool.map(queries_.size(), [this](std::size_t i) { return matchQuery(i); });

    outcome.results.reserve(tasks.size());
    for (auto& task : tasks)
    {
        if (task.ok())
        {
            outcome.results.push_back(std::move(*task.value));
            continue;
        }

        const auto& query = queries_[task.index].original;
        const std::string context = Diagnostics::QueryContext(name(), task.index, query);
        PLOG_ERROR_(Diagnostics::kLogInstance) << "[" << name() << "] query failed " << context << ": " << task.error;
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Matching, "Query skipped after scoring failure",
                                            context + ": " + task.error);
        outcome.failures.push_back(QueryFailure{ task.index, query, task.error });
    }

    state_ = MatchState::Searched;
    return outcome;
}

SearchOutcome MatchAlgorithmBase::findMatches()
{
    return findMatches(utils::WorkerPool(1));
}

void MatchAlgorithmBase::classify(std::vector<MatchResult>& results, double threshold)
{
    applyThreshold(results, threshold);
    state_ = MatchState::Classified;
}

} // namespace matching
