#include "Table.hpp"

#include <stdexcept>

namespace data
{

bool Table::hasColumn(const std::string& name) const
{
    return lookup_.find(name) != lookup_.end();
}

const std::vector<Cell>& Table::column(const std::string& name) const
{
    auto it = lookup_.find(name);
    if (it == lookup_.end())
        throw std::out_of_range("Unknown column: " + name);
    return columns_[it->second];
}

Cell Table::cell(std::size_t row, const std::string& name) const
{
    const auto& cells = column(name);
    if (row >= cells.size())
        return std::nullopt;
    return cells[row];
}

bool Table::addColumn(const std::string& name, std::vector<Cell> cells)
{
    if (hasColumn(name))
        return false;

    if (names_.empty() && index_.empty())
    {
        index_.reserve(cells.size());
        for (std::size_t i = 0; i < cells.size(); ++i)
            index_.push_back(std::to_string(i));
    }
    else if (cells.size() != index_.size())
    {
        throw std::invalid_argument("Column '" + name + "' has " + std::to_string(cells.size()) +
                                    " cells, table has " + std::to_string(index_.size()) + " rows");
    }

    lookup_.emplace(name, names_.size());
    names_.push_back(name);
    columns_.push_back(std::move(cells));
    return true;
}

void Table::setColumn(const std::string& name, std::vector<Cell> cells)
{
    auto it = lookup_.find(name);
    if (it == lookup_.end())
    {
        addColumn(name, std::move(cells));
        return;
    }
    if (cells.size() != index_.size())
        throw std::invalid_argument("Column '" + name + "' size mismatch");
    columns_[it->second] = std::move(cells);
}

std::size_t Table::ensureColumn(const std::string& name)
{
    auto it = lookup_.find(name);
    if (it != lookup_.end())
        return it->second;

    lookup_.emplace(name, names_.size());
    names_.push_back(name);
    columns_.emplace_back(index_.size());
    return names_.size() - 1;
}

void Table::appendRow(std::string label, std::vector<Cell> cells)
{
    index_.push_back(std::move(label));
    for (std::size_t c = 0; c < columns_.size(); ++c)
        columns_[c].push_back(c < cells.size() ? std::move(cells[c]) : std::nullopt);
}

void Table::appendRows(const Table& other)
{
    if (index_name_.empty())
        index_name_ = other.index_name_;

    std::vector<std::size_t> target(other.names_.size());
    for (std::size_t c = 0; c < other.names_.size(); ++c)
        target[c] = ensureColumn(other.names_[c]);

    for (std::size_t r = 0; r < other.rowCount(); ++r)
    {
        index_.push_back(other.index_[r]);
        for (auto& col : columns_)
            col.emplace_back();
        for (std::size_t c = 0; c < other.names_.size(); ++c)
            columns_[target[c]].back() = other.columns_[c][r];
    }
}

void Table::mergeColumns(const Table& other)
{
    if (index_name_.empty())
        index_name_ = other.index_name_;

    // Map other's rows onto ours, appending labels we do not have yet
    std::vector<std::size_t> row_of(other.rowCount());
    std::unordered_map<std::string, std::size_t> rows;
    for (std::size_t r = 0; r < index_.size(); ++r)
        rows.emplace(index_[r], r);

    for (std::size_t r = 0; r < other.rowCount(); ++r)
    {
        auto [it, inserted] = rows.emplace(other.index_[r], index_.size());
        if (inserted)
        {
            index_.push_back(other.index_[r]);
            for (auto& col : columns_)
                col.emplace_back();
        }
        row_of[r] = it->second;
    }

    for (std::size_t c = 0; c < other.names_.size(); ++c)
    {
        if (hasColumn(other.names_[c]))
            continue;

        std::vector<Cell> cells(index_.size());
        // First row wins for duplicated labels
        for (std::size_t r = other.rowCount(); r-- > 0;)
            cells[row_of[r]] = other.columns_[c][r];

        lookup_.emplace(other.names_[c], names_.size());
        names_.push_back(other.names_[c]);
        columns_.push_back(std::move(cells));
    }
}

void Table::resetIndex()
{
    for (std::size_t i = 0; i < index_.size(); ++i)
        index_[i] = std::to_string(i);
}

std::optional<std::size_t> Table::findRow(const std::string& label) const
{
    for (std::size_t r = 0; r < index_.size(); ++r)
    {
        if (index_[r] == label)
            return r;
    }
    return std::nullopt;
}

bool deriveConcatColumn(Table& table, const std::string& target, const std::vector<std::string>& parts,
                        const std::string& separator)
{
    if (parts.empty() || table.hasColumn(target))
        return false;
    for (const auto& part : parts)
    {
        if (!table.hasColumn(part))
            return false;
    }

    std::vector<Cell> cells(table.rowCount());
    for (std::size_t r = 0; r < table.rowCount(); ++r)
    {
        std::string joined;
        bool complete = true;
        for (std::size_t p = 0; p < parts.size() && complete; ++p)
        {
            const Cell& value = table.column(parts[p])[r];
            if (!value)
            {
                complete = false;
                break;
            }
            if (p > 0)
                joined += separator;
            joined += *value;
        }
        if (complete)
            cells[r] = std::move(joined);
    }
    return table.addColumn(target, std::move(cells));
}

void applyStandardDerivations(Table& table)
{
    deriveConcatColumn(table, "STREET", { "STREET_NAME", "STREET_NO" });
    deriveConcatColumn(table, "FULLNAME", { "FIRSTNAME", "LASTNAME" });
}

} // namespace data
