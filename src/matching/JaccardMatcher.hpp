#pragma once

#include "VectorSpaceMatcher.hpp"

namespace matching
{

// Token set overlap |q ∩ r| / |q ∪ r| over whitespace tokens
class JaccardMatcher : public VectorSpaceMatcher
{
public:
    JaccardMatcher() : VectorSpaceMatcher(Weighting::Binary) {}

    Algorithm algorithm() const override { return Algorithm::Jaccard; }

protected:
    std::vector<std::string> extractFeatures(const std::string& normalized) const override;
    double finalizeScore(double overlap, double query_mass, double reference_mass) const override;
};

} // namespace matching
