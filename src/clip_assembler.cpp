#include "clip_assembler.hpp"
#include <algorithm>

namespace wordclip {

std::vector<Clip> merge_clips(std::vector<Clip> candidates, const std::string& separator) {
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const Clip& a, const Clip& b) { return a.start < b.start; });

    std::vector<Clip> merged;
    merged.reserve(candidates.size());

    for (auto& clip : candidates) {
        if (!merged.empty() && clip.start <= merged.back().end) {
            Clip& last = merged.back();
            last.end = std::max(last.end, clip.end);
            last.label += separator;
            last.label += clip.label;
            continue;
        }
        merged.push_back(std::move(clip));
    }

    return merged;
}

bool is_disjoint_sorted(const std::vector<Clip>& clips) {
    for (size_t i = 1; i < clips.size(); ++i) {
        if (!(clips[i - 1].end < clips[i].start)) return false;
    }
    return true;
}

} // namespace wordclip
