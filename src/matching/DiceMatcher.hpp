#pragma once

#include "VectorSpaceMatcher.hpp"

namespace matching
{

// Character bigram multiset overlap 2|q ∩ r| / (|q| + |r|)
class DiceMatcher : public VectorSpaceMatcher
{
public:
    DiceMatcher() : VectorSpaceMatcher(Weighting::Count) {}

    Algorithm algorithm() const override { return Algorithm::Dice; }

protected:
    std::vector<std::string> extractFeatures(const std::string& normalized) const override;
    double finalizeScore(double overlap, double query_mass, double reference_mass) const override;
};

} // namespace matching
