#include "redline/similarity.hpp"

#include "redline/consts.hpp"

#include <cmath>

namespace redline::diff {

double round_ratio(double ratio) { return std::round(ratio * consts::kRatioScale) / consts::kRatioScale; }

double similarity(const Alignment &alignment) {
  if (alignment.total_units == 0)
    return 1.0;
  if (alignment.matched_units == 0)
    return 0.0;
  return round_ratio(2.0 * static_cast<double>(alignment.matched_units) /
                     static_cast<double>(alignment.total_units));
}

double similarity(std::string_view a, std::string_view b, Granularity granularity,
                  bool autojunk) {
  if (a.empty() && b.empty())
    return 1.0;
  if (a.empty() || b.empty())
    return 0.0;
  return similarity(align(a, b, granularity, autojunk));
}

} // namespace redline::diff
