#include "Similarity.hpp"

#include "Vectorizer.hpp"
#include "processing/TextUtils.hpp"

#include <rapidfuzz/distance/Levenshtein.hpp>

#include <algorithm>

namespace matching::similarity
{

namespace
{

struct PairVectors
{
    SparseVector a;
    SparseVector b;
};

PairVectors vectorize(const std::vector<std::string>& fa, const std::vector<std::string>& fb)
{
    Vocabulary vocabulary;
    PairVectors out;
    out.a = countVector(fa, vocabulary);
    out.b = countVector(fb, vocabulary);
    return out;
}

double overlapRatio(double overlap, double denominator)
{
    if (denominator <= 0.0)
        return 0.0;
    return std::clamp(overlap / denominator, 0.0, 1.0);
}

} // namespace

double levenshtein(std::string_view a, std::string_view b)
{
    if (a.empty() || b.empty())
        return 0.0;
    const std::u32string ua = processing::utf8ToUtf32(a);
    const std::u32string ub = processing::utf8ToUtf32(b);
    if (ua.empty() || ub.empty())
        return 0.0;
    return rapidfuzz::levenshtein_normalized_similarity(ua, ub);
}

double jaccard(std::string_view a, std::string_view b)
{
    auto vectors = vectorize(wordFeatures(a), wordFeatures(b));
    binarize(vectors.a);
    binarize(vectors.b);
    const double overlap = minOverlap(vectors.a, vectors.b);
    return overlapRatio(overlap, weightSum(vectors.a) + weightSum(vectors.b) - overlap);
}

double dice(std::string_view a, std::string_view b)
{
    auto vectors = vectorize(charNgramFeatures(a, 2), charNgramFeatures(b, 2));
    return overlapRatio(2.0 * minOverlap(vectors.a, vectors.b), weightSum(vectors.a) + weightSum(vectors.b));
}

double ngram(std::string_view a, std::string_view b, std::size_t n)
{
    auto vectors = vectorize(charNgramFeatures(a, n), charNgramFeatures(b, n));
    const double overlap = minOverlap(vectors.a, vectors.b);
    return overlapRatio(overlap, weightSum(vectors.a) + weightSum(vectors.b) - overlap);
}

bool contains(std::string_view a, std::string_view b)
{
    if (a.empty() || b.empty())
        return false;
    return a.find(b) != std::string_view::npos || b.find(a) != std::string_view::npos;
}

double cosine(std::string_view a, std::string_view b)
{
    auto vectors = vectorize(wordFeatures(a), wordFeatures(b));
    return overlapRatio(dot(vectors.a, vectors.b), l2Norm(vectors.a) * l2Norm(vectors.b));
}

} // namespace matching::similarity
