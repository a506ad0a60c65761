#pragma once

#include <vector>

#include "subalign/config.hpp"
#include "subalign/embedding.hpp"
#include "subalign/progress.hpp"
#include "subalign/types.hpp"
#include "subalign/workspace.hpp"

namespace subalign {

// Half-open range of field positions.
struct FieldRun {
    int start = 0;
    int end = 0;

    int size() const { return end - start; }
    bool empty() const { return end <= start; }
};

// ─── Aligned Mask ────────────────────────────────────────────────────────────

// 1 where the field's score is above threshold.
std::vector<int> aligned_mask(const std::vector<MergedField> &fields,
                              float threshold);

// Viterbi decode of a two-state (unaligned = 0, aligned = 1) HMM over the
// mask. Returns the most likely state per field; ties resolve to aligned.
std::vector<int> smooth_mask(const std::vector<int> &mask,
                             const ExtendedCutConfig &config,
                             Workspace &workspace);

// Maximal runs of 0 in states.
std::vector<FieldRun> unaligned_runs(const std::vector<int> &states);

// ─── Extended Cut Extraction ─────────────────────────────────────────────────

struct ExtendedCutResult {
    std::vector<MergedField> aligned;  // pool for the next refinement pass
    std::vector<MergedField> extended; // primary-only, origin Extended
};

class ExtendedCutExtractor {
  public:
    ExtendedCutExtractor(const ExtendedCutConfig &config, EmbeddingCache &cache,
                         Workspace &workspace)
        : config_(config), cache_(cache), workspace_(workspace) {}

    // Fields scoring above trim_threshold always stay aligned. No surviving
    // run leaves fields untouched with no extension.
    ExtendedCutResult extract(std::vector<MergedField> fields,
                              const StageContext &ctx);

  private:
    ExtendedCutConfig config_;
    EmbeddingCache &cache_;
    Workspace &workspace_;

    // Shrink run from both ends while its border fields look like borderline
    // matches of their aligned neighbours.
    FieldRun trim_(const std::vector<MergedField> &fields,
                   const std::vector<int> &states, FieldRun run);

    float border_score_(const MergedField &field,
                        const MergedField *neighbour);
};

} // namespace subalign
