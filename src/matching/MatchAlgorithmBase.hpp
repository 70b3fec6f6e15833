#pragma once

#include "IMatchAlgorithm.hpp"

#include <optional>

namespace matching
{

// Shared lifecycle handling; subclasses only build their structures and score one query.
class MatchAlgorithmBase : public IMatchAlgorithm
{
public:
    MatchAlgorithmBase() = default;
    ~MatchAlgorithmBase() override = default;

    MatchAlgorithmBase(const MatchAlgorithmBase&) = delete;
    MatchAlgorithmBase& operator=(const MatchAlgorithmBase&) = delete;

    const char* name() const override { return algorithmName(algorithm()); }
    ScoreKind scoreKind() const override { return scoreKindOf(algorithm()); }
    MatchState state() const override { return state_; }

    bool prepare(const Corpus& reference, const Corpus& queries) override;
    std::size_t queryCount() const override { return queries_.size(); }
    MatchResult matchQuery(std::size_t query_index) const override;
    SearchOutcome findMatches(const utils::WorkerPool& pool) override;
    void classify(std::vector<MatchResult>& results, double threshold) override;

    // Sequential search on a single-worker pool
    SearchOutcome findMatches();

protected:
    struct Candidate
    {
        std::optional<std::size_t> reference_index;
        std::optional<double> score;
    };

    // Called with non-empty reference and query sets after the previous state was dropped.
    virtual void onPrepare() = 0;

    // Drops structures derived from a previous prepare().
    virtual void onReset() {}

    // Scores a query with non-empty normalized text.
    [[nodiscard]] virtual Candidate searchQuery(std::size_t query_index) const = 0;

    const Corpus& reference() const { return reference_; }
    const Corpus& queries() const { return queries_; }

private:
    Corpus reference_;
    Corpus queries_;
    MatchState state_ = MatchState::Unprepared;
    bool degraded_ = false;
};

} // namespace matching
