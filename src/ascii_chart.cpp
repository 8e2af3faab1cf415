#include "ascii_chart.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>

namespace httpload {

namespace {

std::string formatLabel(double value) {
  char buffer[64];
  std::snprintf(buffer, sizeof(buffer), "%.2f", value);
  return buffer;
}

} // namespace

std::string plotAsciiChart(const std::vector<double> &series, int height) {
  if (series.empty()) {
    return "";
  }

  auto [minIt, maxIt] = std::minmax_element(series.begin(), series.end());
  const double minimum = *minIt;
  const double maximum = *maxIt;
  const double interval = std::fabs(maximum - minimum);

  if (height <= 0) {
    height = 1;
  }
  const double ratio = interval != 0.0 ? height / interval : 1.0;
  const long minScaled = std::lround(minimum * ratio);
  const long maxScaled = std::lround(maximum * ratio);
  const long rows = std::labs(maxScaled - minScaled);

  // Labels, top row first
  std::vector<std::string> labels;
  size_t labelWidth = 0;
  for (long row = 0; row <= rows; ++row) {
    double magnitude = rows > 0
                           ? maximum - static_cast<double>(row) * interval /
                                           static_cast<double>(rows)
                           : maximum;
    labels.push_back(formatLabel(magnitude));
    labelWidth = std::max(labelWidth, labels.back().size());
  }

  const size_t columns = series.size();
  std::vector<std::vector<std::string>> grid(
      static_cast<size_t>(rows + 1), std::vector<std::string>(columns, " "));

  auto rowOf = [&](double value) {
    return rows - (std::lround(value * ratio) - minScaled);
  };

  std::vector<std::string> axis(static_cast<size_t>(rows + 1), "┤");
  axis[static_cast<size_t>(rowOf(series.front()))] = "┼";

  for (size_t x = 0; x + 1 < columns; ++x) {
    long current = rowOf(series[x]);
    long next = rowOf(series[x + 1]);

    if (current == next) {
      grid[current][x] = "─";
      continue;
    }

    // Row indices grow downwards, so a smaller row is a higher value.
    if (next > current) {
      grid[current][x] = "╮";
      grid[next][x] = "╰";
    } else {
      grid[current][x] = "╯";
      grid[next][x] = "╭";
    }
    for (long y = std::min(current, next) + 1; y < std::max(current, next);
         ++y) {
      grid[y][x] = "│";
    }
  }

  std::string output;
  for (long row = 0; row <= rows; ++row) {
    const std::string &label = labels[static_cast<size_t>(row)];
    output.append(labelWidth - label.size(), ' ');
    output += label;
    output += ' ';
    output += axis[static_cast<size_t>(row)];
    for (const auto &cell : grid[static_cast<size_t>(row)]) {
      output += cell;
    }
    // Trailing blanks of the plot area carry no information.
    output.erase(output.find_last_not_of(' ') + 1);
    if (row < rows) {
      output += '\n';
    }
  }
  return output;
}

} // namespace httpload
