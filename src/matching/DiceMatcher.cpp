#include "DiceMatcher.hpp"

namespace matching
{

std::vector<std::string> DiceMatcher::extractFeatures(const std::string& normalized) const
{
    return charNgramFeatures(normalized, 2);
}

double DiceMatcher::finalizeScore(double overlap, double query_mass, double reference_mass) const
{
    const double total = query_mass + reference_mass;
    return total > 0.0 ? 2.0 * overlap / total : 0.0;
}

} // namespace matching
