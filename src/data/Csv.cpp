#include "Csv.hpp"

#include <plog/Log.h>

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace data
{

std::vector<std::vector<std::string>> parseCsv(std::string_view content, char separator)
{
    std::vector<std::vector<std::string>> records;
    std::vector<std::string> fields;
    std::string current;
    bool in_quotes = false;
    bool row_has_content = false;

    auto end_field = [&]()
    {
        fields.push_back(std::move(current));
        current.clear();
    };
    auto end_record = [&]()
    {
        end_field();
        if (row_has_content || fields.size() > 1 || !fields.front().empty())
            records.push_back(std::move(fields));
        fields.clear();
        row_has_content = false;
    };

    for (std::size_t i = 0; i < content.size(); ++i)
    {
        const char c = content[i];
        if (in_quotes)
        {
            if (c == '"')
            {
                if (i + 1 < content.size() && content[i + 1] == '"')
                {
                    current += '"';
                    ++i;
                }
                else
                {
                    in_quotes = false;
                }
            }
            else
            {
                current += c;
            }
            continue;
        }

        if (c == '"')
        {
            in_quotes = true;
            row_has_content = true;
        }
        else if (c == separator)
        {
            end_field();
            row_has_content = true;
        }
        else if (c == '\r')
        {
            if (i + 1 < content.size() && content[i + 1] == '\n')
                ++i;
            end_record();
        }
        else if (c == '\n')
        {
            end_record();
        }
        else
        {
            current += c;
        }
    }

    if (in_quotes)
        PLOG_WARNING << "CSV ends inside a quoted field";
    if (!current.empty() || !fields.empty() || row_has_content)
        end_record();

    return records;
}

Table parseTable(std::string_view content, char separator)
{
    constexpr std::string_view kBom = "\xEF\xBB\xBF";
    if (content.substr(0, kBom.size()) == kBom)
        content.remove_prefix(kBom.size());

    auto records = parseCsv(content, separator);
    if (records.empty())
        return Table();

    const auto& header = records.front();
    Table table(header.front());

    // Header fields that became columns; duplicated names keep the first
    std::vector<std::size_t> kept;
    for (std::size_t c = 1; c < header.size(); ++c)
    {
        if (table.addColumn(header[c], {}))
            kept.push_back(c);
        else
            PLOG_WARNING << "CSV duplicate column '" << header[c] << "' ignored";
    }

    for (std::size_t r = 1; r < records.size(); ++r)
    {
        auto& record = records[r];
        if (record.size() > header.size())
        {
            PLOG_WARNING << "CSV row " << r << " has " << record.size() << " fields, header has " << header.size();
        }

        std::vector<Cell> cells;
        cells.reserve(kept.size());
        for (std::size_t c : kept)
        {
            Cell value;
            if (c < record.size() && !record[c].empty())
                value = std::move(record[c]);
            cells.push_back(std::move(value));
        }
        table.appendRow(std::move(record.front()), std::move(cells));
    }
    return table;
}

Table readCsv(const std::filesystem::path& path, char separator)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        throw std::runtime_error("Cannot open CSV file: " + path.string());

    std::ostringstream buffer;
    buffer << in.rdbuf();
    return parseTable(buffer.str(), separator);
}

bool needsQuoting(std::string_view field, char separator)
{
    return field.find_first_of(std::string{ separator, '"', '\n', '\r' }) != std::string_view::npos;
}

std::string escapeField(std::string_view field, char separator)
{
    if (!needsQuoting(field, separator))
        return std::string(field);

    std::string out;
    out.reserve(field.size() + 2);
    out += '"';
    for (char c : field)
    {
        if (c == '"')
            out += '"';
        out += c;
    }
    out += '"';
    return out;
}

std::string formatTable(const Table& table, char separator)
{
    std::string out = escapeField(table.indexName(), separator);
    for (const auto& name : table.columnNames())
    {
        out += separator;
        out += escapeField(name, separator);
    }
    out += '\n';

    for (std::size_t r = 0; r < table.rowCount(); ++r)
    {
        out += escapeField(table.index()[r], separator);
        for (const auto& name : table.columnNames())
        {
            out += separator;
            const Cell& value = table.column(name)[r];
            if (value)
                out += escapeField(*value, separator);
        }
        out += '\n';
    }
    return out;
}

void writeCsv(const Table& table, const std::filesystem::path& path, char separator)
{
    std::error_code ec;
    if (path.has_parent_path())
    {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec)
            throw std::runtime_error("Cannot create directory " + path.parent_path().string() + ": " + ec.message());
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
        throw std::runtime_error("Cannot write CSV file: " + path.string());
    out << formatTable(table, separator);
    if (!out)
        throw std::runtime_error("Failed writing CSV file: " + path.string());
}

} // namespace data
