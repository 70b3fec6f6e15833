#pragma once

#include "Table.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace data
{

constexpr char kCsvSeparator = ';';

// Splits CSV text into records; quoted fields may contain separators, quotes ("") and line breaks.
std::vector<std::vector<std::string>> parseCsv(std::string_view content, char separator = kCsvSeparator);

/**
 * @brief Builds a Table from CSV text whose first column is the row label.
 *
 * The header's first field names the index. Empty cells are missing; rows
 * shorter than the header are padded with missing cells and extra fields are
 * dropped. A leading UTF-8 byte order mark is ignored.
 */
Table parseTable(std::string_view content, char separator = kCsvSeparator);

// Throws std::runtime_error when the file cannot be read
Table readCsv(const std::filesystem::path& path, char separator = kCsvSeparator);

std::string formatTable(const Table& table, char separator = kCsvSeparator);

// Creates parent directories; throws std::runtime_error when the file cannot be written
void writeCsv(const Table& table, const std::filesystem::path& path, char separator = kCsvSeparator);

bool needsQuoting(std::string_view field, char separator);
std::string escapeField(std::string_view field, char separator);

} // namespace data
