#pragma once

#include "Table.hpp"
#include "matching/MatchRunner.hpp"

#include <filesystem>
#include <string>

namespace data
{

/**
 * @brief File layout shared with the human validation step and the evaluator.
 *
 * Export: <validation_dir>/<file prefix>/<column>/<date>_<ALGO>_NEED_VALIDATION.csv
 * Import: <validation_dir>/<any>/<dataset>/validated/<any>.csv
 * Results: <output_dir>/<date>_<dataset>_eval_results.csv and
 *          <output_dir>/confusion_matrices/<algo>_<dataset>_confusion_matrix.csv
 *
 * Write failures throw std::runtime_error; unreadable validated files are
 * reported and skipped.
 */
class ValidationStore
{
public:
    static constexpr std::size_t kPartitionPrefixLength = 13;
    static constexpr const char* kCombinedDataset = "BOTH";

    ValidationStore(std::filesystem::path validation_dir, std::filesystem::path output_dir);

    const std::filesystem::path& validationDir() const { return validation_dir_; }
    const std::filesystem::path& outputDir() const { return output_dir_; }

    // First 13 characters of the input file name
    static std::string partitionName(const std::string& input_file);

    // MATCH, <ALGO>_BEST_FOUND_MATCH, <ALGO>_TRUE_MATCH, <ALGO>_BEST_MATCH, <ALGO>_BEST_MATCH_BINARY
    static Table toValidationTable(const matching::MatchTable& table);

    std::filesystem::path validationPath(const std::string& input_file, const std::string& column,
                                         const std::string& algorithm_label, const std::string& date) const;

    std::filesystem::path exportForValidation(const matching::MatchTable& table, const std::string& input_file,
                                              const std::string& column) const;

    /**
     * @brief Validated rows of a dataset ("STREET", "FULLNAME", or "BOTH" for both).
     *
     * Files of one partition are merged column-wise by row label (first
     * duplicate column wins), then partitions are stacked and relabelled
     * 0..n-1. Returns an empty table when nothing was found.
     */
    Table loadValidated(const std::string& dataset) const;

    std::filesystem::path exportEvaluation(const Table& metrics, const std::string& dataset) const;

    std::filesystem::path exportConfusionMatrix(const Table& matrix, const std::string& algorithm,
                                                const std::string& dataset) const;

private:
    Table loadDataset(const std::string& dataset) const;

    std::filesystem::path validation_dir_;
    std::filesystem::path output_dir_;
};

} // namespace data
