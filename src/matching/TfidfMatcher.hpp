#pragma once

#include "VectorSpaceMatcher.hpp"

namespace matching
{

/**
 * @brief Cosine similarity of TF-IDF weighted token vectors.
 *
 * Weights are raw term frequency times the smoothed idf
 * ln((1 + N) / (1 + df)) + 1, where N and df count reference and query
 * records together. Vectors are L2 normalized, so the cosine is the dot product.
 */
class TfidfMatcher : public VectorSpaceMatcher
{
public:
    TfidfMatcher() : VectorSpaceMatcher(Weighting::TfIdf) {}

    Algorithm algorithm() const override { return Algorithm::Tfidf; }

protected:
    std::vector<std::string> extractFeatures(const std::string& normalized) const override;
    double finalizeScore(double overlap, double query_mass, double reference_mass) const override;
};

} // namespace matching
