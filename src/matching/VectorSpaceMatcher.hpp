#pragma once

#include "MatchAlgorithmBase.hpp"
#include "Vectorizer.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace matching
{

/**
 * @brief Shared search for the sparse-vector algorithms (Jaccard, Dice, N-gram, TF-IDF).
 *
 * prepare() fits one vocabulary over reference and query features together,
 * builds a weighted vector per record and an inverted index over the
 * reference vectors. A query then only touches the postings of its own
 * features; references without a shared feature keep an overlap of 0 and are
 * still scored, so the arg-max covers the whole corpus.
 */
class VectorSpaceMatcher : public MatchAlgorithmBase
{
protected:
    enum class Weighting
    {
        Binary, // feature present or not, overlap = set intersection
        Count,  // raw counts, overlap = multiset intersection
        TfIdf   // tf * smoothed idf, L2 normalized, overlap = dot product
    };

    explicit VectorSpaceMatcher(Weighting weighting);

    [[nodiscard]] virtual std::vector<std::string> extractFeatures(const std::string& normalized) const = 0;

    /// Score of one (query, reference) pair; must return 0 where the formula divides by zero
    [[nodiscard]] virtual double finalizeScore(double overlap, double query_mass, double reference_mass) const = 0;

    void onPrepare() override;
    void onReset() override;
    [[nodiscard]] Candidate searchQuery(std::size_t query_index) const override;

private:
    struct Posting
    {
        std::uint32_t reference;
        double weight;
    };

    void applyIdf();
    [[nodiscard]] double mass(const SparseVector& vec) const;

    Weighting weighting_;
    Vocabulary vocabulary_;
    std::vector<SparseVector> reference_vectors_;
    std::vector<SparseVector> query_vectors_;
    std::vector<double> reference_mass_;
    std::vector<std::vector<Posting>> postings_;
};

} // namespace matching
