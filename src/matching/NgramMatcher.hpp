#pragma once

#include "VectorSpaceMatcher.hpp"

#include <cstddef>

namespace matching
{

/**
 * @brief Character n-gram multiset overlap |q ∩ r| / (|q| + |r| - |q ∩ r|).
 *
 * n defaults to 2. Texts shorter than n code points have no n-grams and
 * therefore never match.
 */
class NgramMatcher : public VectorSpaceMatcher
{
public:
    explicit NgramMatcher(std::size_t n = 2);

    Algorithm algorithm() const override { return Algorithm::Ngram; }
    std::size_t ngramSize() const { return n_; }

protected:
    std::vector<std::string> extractFeatures(const std::string& normalized) const override;
    double finalizeScore(double overlap, double query_mass, double reference_mass) const override;

private:
    std::size_t n_;
};

} // namespace matching
