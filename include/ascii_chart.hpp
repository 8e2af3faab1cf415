#pragma once

#include <string>
#include <vector>

namespace httpload {

/**
 * @brief Render a series as a line chart with box-drawing characters.
 *
 * The y axis spans the series range scaled to @p height rows, labelled with
 * two decimals. A flat series renders as a single row.
 *
 * @return The chart lines joined by '\n', or an empty string for an empty
 * series.
 */
std::string plotAsciiChart(const std::vector<double> &series, int height);

} // namespace httpload
