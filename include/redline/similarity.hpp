#pragma once
#include "redline/diff.hpp"

#include <string_view>

namespace redline::diff {

// Round to 4 decimal digits.
double round_ratio(double ratio);

// 2*M/T over an existing alignment, rounded. Both sides empty gives 1.0.
double similarity(const Alignment &alignment);

// Same ratio computed from scratch.
double similarity(std::string_view a, std::string_view b,
                  Granularity granularity = Granularity::Char, bool autojunk = true);

} // namespace redline::diff
