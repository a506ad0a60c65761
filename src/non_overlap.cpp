#include "subalign/non_overlap.hpp"

#include <algorithm>

namespace subalign {

std::vector<TimeInterval>
intervals_of(const std::vector<SubtitleEntry> &entries) {
    std::vector<TimeInterval> out;
    out.reserve(entries.size());
    for (const auto &e : entries)
        out.push_back({e.start, e.end});
    return out;
}

// ─── OverlapIndex ────────────────────────────────────────────────────────────

OverlapIndex::OverlapIndex(std::vector<TimeInterval> intervals) {
    std::sort(intervals.begin(), intervals.end(),
              [](const TimeInterval &a, const TimeInterval &b) {
                  return a.start < b.start;
              });

    starts_.reserve(intervals.size());
    max_end_.reserve(intervals.size());
    int running = 0;
    for (size_t k = 0; k < intervals.size(); ++k) {
        running = k == 0 ? intervals[k].end
                         : std::max(running, intervals[k].end);
        starts_.push_back(intervals[k].start);
        max_end_.push_back(running);
    }
}

bool OverlapIndex::overlaps(int start, int end) const {
    // Candidates: intervals starting before the query ends
    auto it = start < end
                  ? std::lower_bound(starts_.begin(), starts_.end(), end)
                  : std::upper_bound(starts_.begin(), starts_.end(), start);
    auto k = static_cast<size_t>(it - starts_.begin());
    if (k == 0)
        return false;
    return max_end_[k - 1] > start;
}

// ─── Extraction ──────────────────────────────────────────────────────────────

NonOverlapResult
extract_non_overlap(const std::vector<SubtitleEntry> &entries,
                    const std::vector<TimeInterval> &reference,
                    bool input_is_primary) {
    NonOverlapResult result;
    OverlapIndex index(reference);

    for (const auto &e : entries) {
        // Partial overlap stays with alignment
        if (index.overlaps(e.start, e.end)) {
            result.residual.push_back(e);
            continue;
        }

        MergedField f;
        f.start = e.start;
        f.end = e.end;
        f.index = e.index;
        if (input_is_primary) {
            f.primary_text = e.text;
            f.primary_style = e.style;
            f.primary_span = e.span;
            f.origin = FieldOrigin::PrimaryOnly;
        } else {
            f.secondary_text = e.text;
            f.secondary_style = e.style;
            f.secondary_span = e.span;
            f.origin = FieldOrigin::SecondaryOnly;
        }
        result.fields.push_back(std::move(f));
        result.removed_spans.push_back(e.span);
    }
    return result;
}

} // namespace subalign
