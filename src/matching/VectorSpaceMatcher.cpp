#include "VectorSpaceMatcher.hpp"

#include "processing/Diagnostics.hpp"
#include "utils/Profile.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <cmath>

namespace matching
{

VectorSpaceMatcher::VectorSpaceMatcher(Weighting weighting) : weighting_(weighting) {}

void VectorSpaceMatcher::onReset()
{
    vocabulary_.clear();
    reference_vectors_.clear();
    query_vectors_.clear();
    reference_mass_.clear();
    postings_.clear();
}

void VectorSpaceMatcher::onPrepare()
{
    PROFILE_SCOPE_CUSTOM("VectorSpaceMatcher::onPrepare");

    reference_vectors_.reserve(reference().size());
    for (const auto& record : reference())
        reference_vectors_.push_back(countVector(extractFeatures(record.normalized), vocabulary_));

    query_vectors_.reserve(queries().size());
    for (const auto& record : queries())
        query_vectors_.push_back(countVector(extractFeatures(record.normalized), vocabulary_));

    switch (weighting_)
    {
    case Weighting::Binary:
        for (auto& vec : reference_vectors_)
            binarize(vec);
        for (auto& vec : query_vectors_)
            binarize(vec);
        break;
    case Weighting::Count:
        break;
    case Weighting::TfIdf:
        applyIdf();
        break;
    }

    reference_mass_.reserve(reference_vectors_.size());
    postings_.assign(vocabulary_.size(), {});
    for (std::size_t r = 0; r < reference_vectors_.size(); ++r)
    {
        reference_mass_.push_back(mass(reference_vectors_[r]));
        for (const auto& [feature, weight] : reference_vectors_[r])
            postings_[feature].push_back(Posting{ static_cast<std::uint32_t>(r), weight });
    }

    if (processing::Diagnostics::IsVerbose())
    {
        PLOG_DEBUG_(processing::Diagnostics::kLogInstance)
            << "[" << name() << "] vocabulary=" << vocabulary_.size();
    }
}

void VectorSpaceMatcher::applyIdf()
{
    // Document frequency over the joint reference + query collection
    std::vector<double> df(vocabulary_.size(), 0.0);
    auto count_df = [&df](const std::vector<SparseVector>& vectors)
    {
        for (const auto& vec : vectors)
            for (const auto& entry : vec)
                df[entry.first] += 1.0;
    };
    count_df(reference_vectors_);
    count_df(query_vectors_);

    const double n = static_cast<double>(reference_vectors_.size() + query_vectors_.size());
    std::vector<double> idf(df.size());
    for (std::size_t i = 0; i < df.size(); ++i)
        idf[i] = std::log((1.0 + n) / (1.0 + df[i])) + 1.0;

    auto weigh = [&idf](std::vector<SparseVector>& vectors)
    {
        for (auto& vec : vectors)
        {
            for (auto& entry : vec)
                entry.second *= idf[entry.first];
            l2Normalize(vec);
        }
    };
    weigh(reference_vectors_);
    weigh(query_vectors_);
}

double VectorSpaceMatcher::mass(const SparseVector& vec) const
{
    return weighting_ == Weighting::TfIdf ? l2Norm(vec) : weightSum(vec);
}

VectorSpaceMatcher::Candidate VectorSpaceMatcher::searchQuery(std::size_t query_index) const
{
    const SparseVector& query = query_vectors_.at(query_index);
    if (query.empty())
        return {};

    std::vector<double> overlap(reference_vectors_.size(), 0.0);
    for (const auto& [feature, weight] : query)
    {
        for (const auto& posting : postings_[feature])
        {
            if (weighting_ == Weighting::TfIdf)
                overlap[posting.reference] += weight * posting.weight;
            else
                overlap[posting.reference] += std::min(weight, posting.weight);
        }
    }

    const double query_mass = mass(query);
    Candidate best;
    double best_score = -1.0;
    for (std::size_t r = 0; r < overlap.size(); ++r)
    {
        double score = finalizeScore(overlap[r], query_mass, reference_mass_[r]);
        if (!std::isfinite(score))
            score = 0.0;
        score = std::clamp(score, 0.0, 1.0);
        if (score > best_score)
        {
            best_score = score;
            best.reference_index = r;
        }
    }
    best.score = best_score;
    return best;
}

} // namespace matching
