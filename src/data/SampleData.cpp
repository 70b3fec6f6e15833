#include "SampleData.hpp"

#include <initializer_list>

namespace data
{

namespace
{

Table streetTable(std::initializer_list<const char*> streets)
{
    std::vector<Cell> cells;
    for (const char* street : streets)
        cells.emplace_back(street);

    Table table;
    table.addColumn("STREET", std::move(cells));
    return table;
}

} // namespace

Table sampleReference()
{
    return streetTable({ "Schloßstraße", "Stockflethweg", "Über den Bergen", "Überlinger Str.", "Goethestraße",
                         "Bahnhofstrasse", "Musterstraße" });
}

Table sampleQueries()
{
    return streetTable({ "Schlossstr.", "Ueberlinger Straße", "Unter der Buche", "Goethe Str.", "Stockfleterweg" });
}

} // namespace data
