#pragma once

#include "MatchAlgorithmBase.hpp"

namespace matching
{

/**
 * @brief Boolean substring containment in either direction.
 *
 * The first reference (corpus order) with non-empty normalized text that
 * contains the query, or is contained in it, is the best match with score
 * 1.0. Without such a reference the best match is absent and the score 0.0.
 * Configured as "regex".
 */
class ContainmentMatcher : public MatchAlgorithmBase
{
public:
    Algorithm algorithm() const override { return Algorithm::Regex; }

protected:
    void onPrepare() override {}
    Candidate searchQuery(std::size_t query_index) const override;
};

} // namespace matching
