#include "Metrics.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>

namespace evaluation
{

namespace
{

double ratio(double numerator, double denominator)
{
    return denominator > 0.0 ? numerator / denominator : 0.0;
}

} // namespace

std::array<std::optional<double>, 5> MetricSet::values() const
{
    return { accuracy, precision, recall, f1, roc_auc };
}

std::optional<bool> parseLabel(std::string_view text)
{
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
        text.remove_prefix(1);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
        text.remove_suffix(1);

    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "1" || lowered == "1.0" || lowered == "true" || lowered == "yes")
        return true;
    if (lowered == "0" || lowered == "0.0" || lowered == "false" || lowered == "no")
        return false;
    return std::nullopt;
}

ConfusionMatrix computeConfusion(const std::vector<bool>& truth, const std::vector<bool>& predicted)
{
    if (truth.size() != predicted.size())
        throw std::invalid_argument("label vectors differ in size: " + std::to_string(truth.size()) + " vs " +
                                    std::to_string(predicted.size()));

    ConfusionMatrix matrix;
    for (std::size_t i = 0; i < truth.size(); ++i)
    {
        if (truth[i])
            ++(predicted[i] ? matrix.true_positive : matrix.false_negative);
        else
            ++(predicted[i] ? matrix.false_positive : matrix.true_negative);
    }
    return matrix;
}

MetricSet computeMetrics(const ConfusionMatrix& m)
{
    const double tp = static_cast<double>(m.true_positive);
    const double tn = static_cast<double>(m.true_negative);
    const double fp = static_cast<double>(m.false_positive);
    const double fn = static_cast<double>(m.false_negative);

    MetricSet metrics;
    metrics.accuracy = ratio(tp + tn, static_cast<double>(m.total()));
    metrics.precision = ratio(tp, tp + fp);
    metrics.recall = ratio(tp, tp + fn);
    metrics.f1 = ratio(2.0 * metrics.precision * metrics.recall, metrics.precision + metrics.recall);

    if (m.positives() > 0 && m.negatives() > 0)
    {
        const double tpr = tp / static_cast<double>(m.positives());
        const double fpr = fp / static_cast<double>(m.negatives());
        metrics.roc_auc = (1.0 + tpr - fpr) / 2.0;
    }
    return metrics;
}

} // namespace evaluation
