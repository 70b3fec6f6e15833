#include "ContainmentMatcher.hpp"

namespace matching
{

ContainmentMatcher::Candidate ContainmentMatcher::searchQuery(std::size_t query_index) const
{
    const std::string& query = queries().at(query_index).normalized;

    Candidate candidate;
    candidate.score = 0.0;
    const auto& refs = reference();
    for (std::size_t r = 0; r < refs.size(); ++r)
    {
        const std::string& text = refs[r].normalized;
        if (text.empty())
            continue;
        if (text.find(query) != std::string::npos || query.find(text) != std::string::npos)
        {
            candidate.reference_index = r;
            candidate.score = 1.0;
            break;
        }
    }
    return candidate;
}

} // namespace matching
