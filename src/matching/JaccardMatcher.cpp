#include "JaccardMatcher.hpp"

namespace matching
{

std::vector<std::string> JaccardMatcher::extractFeatures(const std::string& normalized) const
{
    return wordFeatures(normalized);
}

double JaccardMatcher::finalizeScore(double overlap, double query_mass, double reference_mass) const
{
    const double union_size = query_mass + reference_mass - overlap;
    return union_size > 0.0 ? overlap / union_size : 0.0;
}

} // namespace matching
