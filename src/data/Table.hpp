#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace data
{

// Absent = missing value (empty CSV cell)
using Cell = std::optional<std::string>;

/**
 * @brief Column-oriented table of optional string cells with a row label column.
 *
 * Column order is insertion order. Row labels are kept as text and need not
 * be unique; lookups by label resolve to the first row carrying it.
 */
class Table
{
public:
    Table() = default;
    explicit Table(std::string index_name) : index_name_(std::move(index_name)) {}

    const std::string& indexName() const { return index_name_; }
    void setIndexName(std::string name) { index_name_ = std::move(name); }

    std::size_t rowCount() const { return index_.size(); }
    std::size_t columnCount() const { return names_.size(); }
    bool empty() const { return index_.empty() && names_.empty(); }

    const std::vector<std::string>& columnNames() const { return names_; }
    const std::vector<std::string>& index() const { return index_; }

    bool hasColumn(const std::string& name) const;

    // Throws std::out_of_range for an unknown column
    const std::vector<Cell>& column(const std::string& name) const;

    Cell cell(std::size_t row, const std::string& name) const;

    /**
     * @brief Adds a column holding one cell per row.
     *
     * The first column added to a table without rows defines the row count
     * and gets labels "0".."n-1". Throws std::invalid_argument on a size
     * mismatch; returns false without changes when the name already exists.
     */
    bool addColumn(const std::string& name, std::vector<Cell> cells);

    // Adds the column or replaces the cells of an existing one
    void setColumn(const std::string& name, std::vector<Cell> cells);

    // cells follow columnNames(); missing trailing cells are absent
    void appendRow(std::string label, std::vector<Cell> cells);

    // Row-wise union: columns unknown to either side are absent in the other's rows
    void appendRows(const Table& other);

    // Outer join on row labels; of two columns with the same name the existing one wins
    void mergeColumns(const Table& other);

    // Relabels rows "0".."n-1"
    void resetIndex();

    std::optional<std::size_t> findRow(const std::string& label) const;

private:
    std::size_t ensureColumn(const std::string& name);

    std::string index_name_;
    std::vector<std::string> index_;
    std::vector<std::string> names_;
    std::vector<std::vector<Cell>> columns_;
    std::unordered_map<std::string, std::size_t> lookup_;
};

/**
 * @brief Adds target = parts joined by separator, row by row.
 *
 * Skipped (returns false) when target already exists or a part column is
 * missing. A row with any missing part gets a missing cell.
 */
bool deriveConcatColumn(Table& table, const std::string& target, const std::vector<std::string>& parts,
                        const std::string& separator = " ");

// STREET = STREET_NAME + " " + STREET_NO, FULLNAME = FIRSTNAME + " " + LASTNAME
void applyStandardDerivations(Table& table);

} // namespace data
