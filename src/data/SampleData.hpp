#pragma once

#include "Table.hpp"

namespace data
{

// Built-in street lists used when matching.debug is set, so the pipeline runs without input files.
Table sampleReference();
Table sampleQueries();

} // namespace data
