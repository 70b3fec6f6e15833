#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace evaluation
{

// Row order of the metrics table
inline constexpr std::array<const char*, 5> kMetricNames{ "Accuracy", "Precision", "Recall", "F1-Score", "ROC-AUC" };

struct ConfusionMatrix
{
    std::size_t true_negative = 0;
    std::size_t false_positive = 0;
    std::size_t false_negative = 0;
    std::size_t true_positive = 0;

    std::size_t total() const { return true_negative + false_positive + false_negative + true_positive; }
    std::size_t positives() const { return true_positive + false_negative; }
    std::size_t negatives() const { return true_negative + false_positive; }
};

/**
 * @brief Standard binary classification metrics.
 *
 * Ratios with a zero denominator are 0. roc_auc is computed from the hard
 * predictions, (1 + TPR - FPR) / 2, and is absent when the ground truth holds
 * a single class.
 */
struct MetricSet
{
    double accuracy = 0.0;
    double precision = 0.0;
    double recall = 0.0;
    double f1 = 0.0;
    std::optional<double> roc_auc;

    // Values in kMetricNames order
    std::array<std::optional<double>, 5> values() const;
};

// 1/0/1.0/0.0/true/false/yes/no, case-insensitive and trimmed; anything else is absent
std::optional<bool> parseLabel(std::string_view text);

// Throws std::invalid_argument when the sizes differ
ConfusionMatrix computeConfusion(const std::vector<bool>& truth, const std::vector<bool>& predicted);

MetricSet computeMetrics(const ConfusionMatrix& matrix);

} // namespace evaluation
