#include "NgramMatcher.hpp"

#include <stdexcept>

namespace matching
{

NgramMatcher::NgramMatcher(std::size_t n) : VectorSpaceMatcher(Weighting::Count), n_(n)
{
    if (n_ == 0)
        throw std::invalid_argument("ngram size must be at least 1");
}

std::vector<std::string> NgramMatcher::extractFeatures(const std::string& normalized) const
{
    return charNgramFeatures(normalized, n_);
}

double NgramMatcher::finalizeScore(double overlap, double query_mass, double reference_mass) const
{
    const double denominator = query_mass + reference_mass - overlap;
    return denominator > 0.0 ? overlap / denominator : 0.0;
}

} // namespace matching
