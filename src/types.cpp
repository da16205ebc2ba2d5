#include "types.hpp"
#include <algorithm>

namespace wordclip {

void sort_by_start(std::vector<TimestampedUnit>& units) {
    std::stable_sort(units.begin(), units.end(),
                     [](const TimestampedUnit& a, const TimestampedUnit& b) {
                         return a.start < b.start;
                     });
}

} // namespace wordclip
