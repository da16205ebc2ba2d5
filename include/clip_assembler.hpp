#pragma once

#include "types.hpp"
#include <string>
#include <vector>

namespace wordclip {

constexpr const char* DEFAULT_LABEL_SEPARATOR = ", ";

// Interval union over candidate windows from any matcher.
// Output is sorted by start and pairwise non-overlapping; windows that touch
// (next.start == current.end) are merged. Labels of merged windows are joined
// with `separator` in start order. Ties on start keep input order.
std::vector<Clip> merge_clips(std::vector<Clip> candidates,
                              const std::string& separator = DEFAULT_LABEL_SEPARATOR);

// Sorted ascending by start and clip[i].end < clip[i + 1].start for all i
bool is_disjoint_sorted(const std::vector<Clip>& clips);

} // namespace wordclip
