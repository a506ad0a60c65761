#pragma once

#include <vector>

namespace subalign {

enum class MergeMode {
    Synced, // tracks share a timeline (full or partial overlap)
    Cuts,   // primary is an extended cut of the secondary
};

// ─── Pipeline Stages ─────────────────────────────────────────────────────────

enum class Stage {
    Init,              // validation + tokenization
    ExtractNonOverlap, // time-disjoint entries
    DtwAlign,          // coarse token alignment
    Refine,            // window refinement, W = 3
    ExtractExtended,   // cuts only
    RefineExtended,    // cuts only, W = 2
    Combine,
    Cleanup,
    Done,
};

const char *stage_name(Stage stage);

// Stage sequence for a mode (Done excluded).
std::vector<Stage> stage_sequence(MergeMode mode);

// ─── Progress Weights ────────────────────────────────────────────────────────

struct StageWeights {
    float init = 0.05f;
    float extract_non_overlap = 0.05f;
    float dtw_align = 0.35f;
    float refine = 0.45f;
    float extract_extended = 0.0f;
    float refine_extended = 0.0f;
    float combine = 0.05f;
    float cleanup = 0.05f;

    float weight(Stage stage) const;
};

// ─── DTW Config ──────────────────────────────────────────────────────────────

struct DtwConfig {
    // Above this many cells the accumulated cost is restricted to a band.
    long long full_matrix_limit = 4'000'000;
    int band_radius = 64; // tokens either side of the diagonal
};

// ─── Refiner Config ──────────────────────────────────────────────────────────

struct RefineConfig {
    int window = 3;              // first pass
    int extended_window = 2;     // pass after extended-cut extraction
    int max_window_tokens = 24;  // above this, cut only at line boundaries
    float split_penalty = 1e-3f; // per cut inside one secondary line
};

// ─── Extended Cut Config ─────────────────────────────────────────────────────

struct ExtendedCutConfig {
    float align_threshold = 0.5f; // score above → aligned
    float trim_threshold = 0.7f;  // borderline match → not an extension

    // Two-state HMM used to denoise the aligned mask
    float hmm_stay = 0.8f;           // P(state_t == state_{t-1})
    float hmm_emit_aligned = 0.98f;  // P(mask = 1 | aligned)
    float hmm_emit_unaligned = 0.8f; // P(mask = 0 | unaligned)
};

// ─── Merge Config ────────────────────────────────────────────────────────────

struct MergeConfig {
    MergeMode mode = MergeMode::Synced;
    int batch_size = 32; // strings per embedding call
    bool ignore_non_overlap_filter = false;
    bool retain_newline = false;

    DtwConfig dtw;
    RefineConfig refine;
    ExtendedCutConfig extended;
    StageWeights weights;
};

// ─── Presets ─────────────────────────────────────────────────────────────────

inline StageWeights make_stage_weights(MergeMode mode) {
    StageWeights w;
    if (mode == MergeMode::Cuts) {
        w.init = 0.05f;
        w.extract_non_overlap = 0.0f;
        w.dtw_align = 0.30f;
        w.refine = 0.30f;
        w.extract_extended = 0.10f;
        w.refine_extended = 0.15f;
        w.combine = 0.05f;
        w.cleanup = 0.05f;
    }
    return w;
}

inline MergeConfig make_synced_config() {
    MergeConfig cfg;
    cfg.mode = MergeMode::Synced;
    cfg.weights = make_stage_weights(MergeMode::Synced);
    return cfg;
}

inline MergeConfig make_cuts_config() {
    MergeConfig cfg;
    cfg.mode = MergeMode::Cuts;
    cfg.ignore_non_overlap_filter = true;
    cfg.weights = make_stage_weights(MergeMode::Cuts);
    return cfg;
}

// Throws std::invalid_argument on an inconsistent config.
void validate_config(const MergeConfig &config);

} // namespace subalign
