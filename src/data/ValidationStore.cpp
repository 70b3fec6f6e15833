#include "ValidationStore.hpp"

#include "Csv.hpp"
#include "utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace data
{

namespace fs = std::filesystem;

namespace
{

std::string formatScore(double score)
{
    std::ostringstream out;
    out << std::setprecision(15) << score;
    return out.str();
}

const char* pythonBool(bool value)
{
    return value ? "True" : "False";
}

std::vector<fs::path> sortedEntries(const fs::path& dir, bool directories)
{
    std::vector<fs::path> entries;
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec))
    {
        if (directories ? it->is_directory(ec) : (it->is_regular_file(ec) && it->path().extension() == ".csv"))
            entries.push_back(it->path());
    }
    if (ec)
    {
        PLOG_WARNING << "Cannot list " << dir.string() << ": " << ec.message();
    }
    std::sort(entries.begin(), entries.end());
    return entries;
}

} // namespace

ValidationStore::ValidationStore(fs::path validation_dir, fs::path output_dir)
    : validation_dir_(std::move(validation_dir))
    , output_dir_(std::move(output_dir))
{
}

std::string ValidationStore::partitionName(const std::string& input_file)
{
    const std::string file_name = fs::path(input_file).filename().string();
    return file_name.substr(0, std::min(file_name.size(), kPartitionPrefixLength));
}

Table ValidationStore::toValidationTable(const matching::MatchTable& table)
{
    const std::string prefix = matching::algorithmLabel(table.algorithm) + "_";
    const bool boolean = table.score_kind == matching::ScoreKind::Boolean;

    std::vector<Cell> match, best_found, true_match, best_score, binary;
    Table out;
    for (const auto& row : table.rows)
    {
        match.emplace_back(row.query);
        best_found.push_back(row.best_match);
        true_match.push_back(row.ground_truth ? Cell(pythonBool(*row.ground_truth)) : std::nullopt);
        if (!row.score)
            best_score.emplace_back();
        else if (boolean)
            best_score.emplace_back(pythonBool(*row.score >= 1.0));
        else
            best_score.emplace_back(formatScore(*row.score));
        binary.emplace_back(pythonBool(row.accepted.value_or(false)));
    }

    for (const auto& row : table.rows)
        out.appendRow(table.rowLabel(row), {});
    out.setColumn("MATCH", std::move(match));
    out.setColumn(prefix + "BEST_FOUND_MATCH", std::move(best_found));
    out.setColumn(prefix + "TRUE_MATCH", std::move(true_match));
    out.setColumn(prefix + "BEST_MATCH", std::move(best_score));
    out.setColumn(prefix + "BEST_MATCH_BINARY", std::move(binary));
    return out;
}

fs::path ValidationStore::validationPath(const std::string& input_file, const std::string& column,
                                         const std::string& algorithm_label, const std::string& date) const
{
    return validation_dir_ / partitionName(input_file) / column /
           (date + "_" + algorithm_label + "_NEED_VALIDATION.csv");
}

fs::path ValidationStore::exportForValidation(const matching::MatchTable& table, const std::string& input_file,
                                              const std::string& column) const
{
    const fs::path path = validationPath(input_file, column, matching::algorithmLabel(table.algorithm),
                                         utils::ErrorReporter::GetDate());
    writeCsv(toValidationTable(table), path);
    PLOG_INFO << "Exported " << table.rows.size() << " rows for validation to " << path.string();
    return path;
}

Table ValidationStore::loadValidated(const std::string& dataset) const
{
    Table result;
    if (dataset == kCombinedDataset)
    {
        result = loadDataset("STREET");
        result.appendRows(loadDataset("FULLNAME"));
    }
    else
    {
        result = loadDataset(dataset);
    }
    result.resetIndex();
    return result;
}

Table ValidationStore::loadDataset(const std::string& dataset) const
{
    Table stacked;
    std::error_code ec;
    if (!fs::is_directory(validation_dir_, ec))
    {
        PLOG_WARNING << "Validation directory " << validation_dir_.string() << " does not exist";
        return stacked;
    }

    for (const auto& partition : sortedEntries(validation_dir_, true))
    {
        const fs::path validated = partition / dataset / "validated";
        if (!fs::is_directory(validated, ec))
            continue;

        Table merged;
        bool any = false;
        for (const auto& file : sortedEntries(validated, false))
        {
            try
            {
                Table part = readCsv(file);
                if (!any)
                    merged = std::move(part);
                else
                    merged.mergeColumns(part);
                any = true;
            }
            catch (const std::exception& ex)
            {
                utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Input, "Validated file skipped",
                                                    file.string() + ": " + ex.what());
            }
        }
        if (any)
            stacked.appendRows(merged);
    }
    PLOG_DEBUG << "Loaded " << stacked.rowCount() << " validated rows for " << dataset;
    return stacked;
}

fs::path ValidationStore::exportEvaluation(const Table& metrics, const std::string& dataset) const
{
    const fs::path path = output_dir_ / (utils::ErrorReporter::GetDate() + "_" + dataset + "_eval_results.csv");
    writeCsv(metrics, path);
    return path;
}

fs::path ValidationStore::exportConfusionMatrix(const Table& matrix, const std::string& algorithm,
                                                const std::string& dataset) const
{
    const fs::path path = output_dir_ / "confusion_matrices" / (algorithm + "_" + dataset + "_confusion_matrix.csv");
    writeCsv(matrix, path);
    return path;
}

} // namespace data
