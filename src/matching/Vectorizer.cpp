#include "Vectorizer.hpp"

#include "processing/TextUtils.hpp"

#include <algorithm>
#include <cmath>
#include <map>

namespace matching
{

std::uint32_t Vocabulary::add(const std::string& feature)
{
    auto [it, inserted] = ids_.try_emplace(feature, static_cast<std::uint32_t>(ids_.size()));
    return it->second;
}

std::optional<std::uint32_t> Vocabulary::find(const std::string& feature) const
{
    auto it = ids_.find(feature);
    if (it == ids_.end())
        return std::nullopt;
    return it->second;
}

std::vector<std::string> wordFeatures(std::string_view normalized)
{
    return processing::splitTokens(normalized);
}

std::vector<std::string> charNgramFeatures(std::string_view normalized, std::size_t n)
{
    std::vector<std::string> grams;
    if (n == 0)
        return grams;

    const std::u32string text = processing::utf8ToUtf32(normalized);
    if (text.size() < n)
        return grams;

    grams.reserve(text.size() - n + 1);
    for (std::size_t i = 0; i + n <= text.size(); ++i)
        grams.push_back(processing::utf32ToUtf8(text.substr(i, n)));
    return grams;
}

SparseVector countVector(const std::vector<std::string>& features, Vocabulary& vocabulary)
{
    std::map<std::uint32_t, double> counts;
    for (const auto& feature : features)
        counts[vocabulary.add(feature)] += 1.0;
    return SparseVector(counts.begin(), counts.end());
}

void binarize(SparseVector& vec)
{
    for (auto& entry : vec)
        entry.second = 1.0;
}

double weightSum(const SparseVector& vec)
{
    double total = 0.0;
    for (const auto& entry : vec)
        total += entry.second;
    return total;
}

double l2Norm(const SparseVector& vec)
{
    double total = 0.0;
    for (const auto& entry : vec)
        total += entry.second * entry.second;
    return std::sqrt(total);
}

void l2Normalize(SparseVector& vec)
{
    const double norm = l2Norm(vec);
    if (norm <= 0.0)
        return;
    for (auto& entry : vec)
        entry.second /= norm;
}

namespace
{

template<typename Combine>
double mergeJoin(const SparseVector& a, const SparseVector& b, Combine combine)
{
    double total = 0.0;
    auto ia = a.begin();
    auto ib = b.begin();
    while (ia != a.end() && ib != b.end())
    {
        if (ia->first < ib->first)
            ++ia;
        else if (ib->first < ia->first)
            ++ib;
        else
        {
            total += combine(ia->second, ib->second);
            ++ia;
            ++ib;
        }
    }
    return total;
}

} // namespace

double minOverlap(const SparseVector& a, const SparseVector& b)
{
    return mergeJoin(a, b, [](double x, double y) { return std::min(x, y); });
}

double dot(const SparseVector& a, const SparseVector& b)
{
    return mergeJoin(a, b, [](double x, double y) { return x * y; });
}

} // namespace matching
