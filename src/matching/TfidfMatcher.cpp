#include "TfidfMatcher.hpp"

namespace matching
{

std::vector<std::string> TfidfMatcher::extractFeatures(const std::string& normalized) const
{
    return wordFeatures(normalized);
}

double TfidfMatcher::finalizeScore(double overlap, double query_mass, double reference_mass) const
{
    // Unit vectors, except the zero vector of a record without tokens
    if (query_mass <= 0.0 || reference_mass <= 0.0)
        return 0.0;
    return overlap / (query_mass * reference_mass);
}

} // namespace matching
