#pragma once

#include <utility>
#include <vector>

#include "subalign/config.hpp"
#include "subalign/embedding.hpp"
#include "subalign/progress.hpp"
#include "subalign/types.hpp"
#include "subalign/workspace.hpp"

namespace subalign {

// ─── Banded Accumulated Cost ─────────────────────────────────────────────────

// Allowed secondary columns [lo[i], hi[i]) for every primary row i.
// Both bounds are non-decreasing and consecutive rows always connect.
struct DtwBand {
    std::vector<int> lo;
    std::vector<int> hi;

    static DtwBand full(int n, int m);
    static DtwBand around_diagonal(int n, int m, int radius);

    long long cells() const;
};

// Accumulated-cost matrix restricted to a band, stored row by row in a
// workspace buffer. Rows must be filled in order.
class DtwMatrix {
  public:
    DtwMatrix(const DtwBand &band, Workspace &workspace);

    // cost points at hi[i] - lo[i] values for columns lo[i] .. hi[i]-1.
    void fill_row(int i, const float *cost);

    // Optimal path from (0, 0) to (n-1, m-1). Moves: diagonal, primary only,
    // secondary only; ties prefer diagonal, then primary only.
    std::vector<std::pair<int, int>> path() const;

    float total_cost() const;

  private:
    const DtwBand &band_;
    std::vector<float> &acc_;
    std::vector<long long> offset_;
    int n_ = 0;
    int m_ = 0;

    float at_(int i, int j) const;
};

// DTW over an explicit row-major n x m cost matrix (full band).
std::vector<std::pair<int, int>> dtw_path(const std::vector<float> &cost,
                                          int n, int m, Workspace &workspace);

// ─── DTW Aligner ─────────────────────────────────────────────────────────────

class DtwAligner {
  public:
    DtwAligner(const DtwConfig &config, int batch_size, Workspace &workspace)
        : config_(config), batch_size_(batch_size), workspace_(workspace) {}

    // For every primary token the secondary token indices aligned to it, in
    // ascending order. Empty input returns without touching the provider.
    std::vector<std::vector<int>> align_tokens(const FlatTokens &primary,
                                               const FlatTokens &secondary,
                                               EmbeddingCache &cache,
                                               const StageContext &ctx);

    // Token alignment regrouped per primary entry.
    std::vector<MergedField>
    align(const std::vector<SubtitleEntry> &primary_entries,
          const FlatTokens &primary,
          const std::vector<SubtitleEntry> &secondary_entries,
          const FlatTokens &secondary, EmbeddingCache &cache,
          const StageContext &ctx);

  private:
    DtwConfig config_;
    int batch_size_;
    Workspace &workspace_;
};

// A primary entry inherits the union of secondary tokens aligned to any of
// its tokens, as one span [min, max + 1).
std::vector<MergedField>
group_by_entry(const std::vector<std::vector<int>> &pairing,
               const std::vector<SubtitleEntry> &primary_entries,
               const FlatTokens &primary,
               const std::vector<SubtitleEntry> &secondary_entries,
               const FlatTokens &secondary);

} // namespace subalign
