#pragma once

#include <functional>
#include <vector>

#include "subalign/config.hpp"
#include "subalign/embedding.hpp"
#include "subalign/progress.hpp"
#include "subalign/types.hpp"

namespace subalign {

struct RefineResult {
    std::vector<MergedField> fields;
    int stage_number = 0; // incremented once per refinement pass
};

// ─── Span Bookkeeping ────────────────────────────────────────────────────────

// Make secondary spans monotonic and disjoint. A span overlapping an earlier
// one loses the shared tokens; an emptied span sits at the previous end.
void normalize_spans(std::vector<MergedField> &fields);

// Give secondary tokens [0, total) not covered by any span to the nearest
// preceding non-empty field. Tokens before the first span go to the first
// non-empty field; if every span is empty the first field takes them all.
void absorb_leftovers(std::vector<MergedField> &fields, int total);

// Best split of the tokens between points.front() and points.back() into
// parts ordered consecutive spans whose boundaries are taken from points
// (ascending). score(k, s) is the similarity of field k to span s (empty
// spans are never passed and score 0). cut_cost(p), when given, is subtracted
// for every inner boundary placed at p. Ties give more material to earlier
// fields.
std::vector<TokenSpan>
best_partition_at(const std::vector<int> &points, int parts,
                  const std::function<float(int, TokenSpan)> &score,
                  const std::function<float(int)> &cut_cost = {});

// Same over every token boundary of span.
std::vector<TokenSpan>
best_partition(TokenSpan span, int parts,
               const std::function<float(int, TokenSpan)> &score,
               const std::function<float(int)> &cut_cost = {});

// ─── Window Refiner ──────────────────────────────────────────────────────────

// Re-partitions the secondary tokens held by every W consecutive fields so the
// sum of entry-level similarities is maximal. Cutting inside one secondary
// line costs split_penalty. Regions above max_window_tokens are cut only at
// secondary line boundaries and at the current field boundaries.
class WindowRefiner {
  public:
    WindowRefiner(const RefineConfig &config, EmbeddingCache &cache)
        : config_(config), cache_(cache) {}

    RefineResult refine(std::vector<MergedField> fields,
                        const std::vector<SubtitleEntry> &secondary_entries,
                        const FlatTokens &secondary, int window,
                        int stage_number, const StageContext &ctx);

  private:
    RefineConfig config_;
    EmbeddingCache &cache_;

    std::vector<int> cut_points_(const std::vector<MergedField> &fields,
                                 size_t first, size_t count, TokenSpan region,
                                 const FlatTokens &secondary) const;

    void refine_window_(std::vector<MergedField> &fields, size_t first,
                        size_t count,
                        const std::vector<SubtitleEntry> &secondary_entries,
                        const FlatTokens &secondary);

    void rescore_(std::vector<MergedField> &fields,
                  const std::vector<SubtitleEntry> &secondary_entries,
                  const FlatTokens &secondary, const StageContext &ctx);
};

} // namespace subalign
