#pragma once

#include "MatchTypes.hpp"

#include <cstddef>
#include <memory>
#include <vector>

namespace utils
{
class WorkerPool;
}

namespace matching
{

/**
 * @brief Common contract of the best-match search algorithms.
 *
 * Lifecycle: prepare -> findMatches -> classify.
 *
 * - prepare(reference, queries) copies both corpora and builds the algorithm's
 *   working structures (vocabulary, vectors, indexes). An empty reference or
 *   query set does not fail: every query then reports "no match".
 * - matchQuery(i) scores query i against every reference record and keeps the
 *   arg-max (lowest reference index on ties). It only reads prepared state and
 *   may be called from several threads at once.
 * - findMatches(pool) runs matchQuery for every query on the pool and returns
 *   results in query order. A query whose scoring throws is reported in
 *   SearchOutcome::failures instead of aborting the batch.
 * - classify(results, threshold) sets accepted = score >= threshold.
 *
 * An instance is not safe for concurrent prepare() calls; use one instance per run.
 */
class IMatchAlgorithm
{
public:
    virtual ~IMatchAlgorithm() = default;

    [[nodiscard]] virtual Algorithm algorithm() const = 0;
    [[nodiscard]] virtual const char* name() const = 0;
    [[nodiscard]] virtual ScoreKind scoreKind() const = 0;
    [[nodiscard]] virtual MatchState state() const = 0;

    /**
     * @return false when the run is degraded to "no match" (empty reference or query set)
     */
    virtual bool prepare(const Corpus& reference, const Corpus& queries) = 0;

    [[nodiscard]] virtual std::size_t queryCount() const = 0;

    [[nodiscard]] virtual MatchResult matchQuery(std::size_t query_index) const = 0;

    virtual SearchOutcome findMatches(const utils::WorkerPool& pool) = 0;

    virtual void classify(std::vector<MatchResult>& results, double threshold) = 0;
};

// Factory function to create a fresh matcher for one run
std::unique_ptr<IMatchAlgorithm> createMatcher(Algorithm algorithm, const MatcherOptions& options = {});

} // namespace matching
