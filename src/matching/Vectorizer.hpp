#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace matching
{

// (feature id, weight) pairs sorted by feature id, no duplicate ids
using SparseVector = std::vector<std::pair<std::uint32_t, double>>;

/**
 * @brief Feature -> dense id mapping shared by the reference and query vectors of one run.
 *
 * Ids are assigned in first-seen order. A vocabulary belongs to exactly one
 * prepare() call and is rebuilt from scratch by the next one.
 */
class Vocabulary
{
public:
    std::uint32_t add(const std::string& feature);
    [[nodiscard]] std::optional<std::uint32_t> find(const std::string& feature) const;
    [[nodiscard]] std::size_t size() const { return ids_.size(); }
    void clear() { ids_.clear(); }

private:
    std::unordered_map<std::string, std::uint32_t> ids_;
};

// Whitespace separated tokens of already normalized text
std::vector<std::string> wordFeatures(std::string_view normalized);

// Overlapping n-code-point windows (spaces included); empty when the text is shorter than n
std::vector<std::string> charNgramFeatures(std::string_view normalized, std::size_t n);

// Term counts over the vocabulary, growing it with unseen features
SparseVector countVector(const std::vector<std::string>& features, Vocabulary& vocabulary);

// Every weight replaced by 1.0 (set semantics)
void binarize(SparseVector& vec);

[[nodiscard]] double weightSum(const SparseVector& vec);
[[nodiscard]] double l2Norm(const SparseVector& vec);

// No-op for the zero vector
void l2Normalize(SparseVector& vec);

// Sum of min(a_i, b_i): size of the multiset intersection for count vectors
[[nodiscard]] double minOverlap(const SparseVector& a, const SparseVector& b);

[[nodiscard]] double dot(const SparseVector& a, const SparseVector& b);

} // namespace matching
