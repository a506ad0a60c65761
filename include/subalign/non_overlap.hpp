#pragma once

#include <vector>

#include "subalign/types.hpp"

namespace subalign {

struct TimeInterval {
    int start = 0; // ms
    int end = 0;   // ms
};

std::vector<TimeInterval>
intervals_of(const std::vector<SubtitleEntry> &entries);

// ─── Overlap Index ───────────────────────────────────────────────────────────

// Reference intervals sorted by start with a running maximum of their ends,
// so "does [start, end) touch any reference interval" is a binary search.
class OverlapIndex {
  public:
    explicit OverlapIndex(std::vector<TimeInterval> intervals);

    // Positive-length intersection with any reference interval. Touching
    // endpoints do not count; a zero-length query overlaps an interval that
    // contains its instant.
    bool overlaps(int start, int end) const;

    size_t size() const { return starts_.size(); }

  private:
    std::vector<int> starts_;
    std::vector<int> max_end_; // max end over intervals [0, k]
};

// ─── Non-Overlap Extraction ──────────────────────────────────────────────────

struct NonOverlapResult {
    std::vector<MergedField> fields;      // PrimaryOnly / SecondaryOnly
    std::vector<SubtitleEntry> residual;  // still to align, input order
    std::vector<TokenSpan> removed_spans; // token spans of extracted entries
};

// Split entries into those with no time intersection with any reference
// interval (carried over as one-sided fields) and the residual to align.
// Every input entry ends up in exactly one of the two lists.
NonOverlapResult
extract_non_overlap(const std::vector<SubtitleEntry> &entries,
                    const std::vector<TimeInterval> &reference,
                    bool input_is_primary);

} // namespace subalign
