#include "subalign/config.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace subalign {

const char *stage_name(Stage stage) {
    switch (stage) {
    case Stage::Init:
        return "init";
    case Stage::ExtractNonOverlap:
        return "extract_non_overlap";
    case Stage::DtwAlign:
        return "dtw_align";
    case Stage::Refine:
        return "refine";
    case Stage::ExtractExtended:
        return "extract_extended";
    case Stage::RefineExtended:
        return "refine_extended";
    case Stage::Combine:
        return "combine";
    case Stage::Cleanup:
        return "cleanup";
    case Stage::Done:
        return "done";
    }
    return "unknown";
}

std::vector<Stage> stage_sequence(MergeMode mode) {
    if (mode == MergeMode::Cuts) {
        return {Stage::Init,         Stage::DtwAlign,
                Stage::Refine,       Stage::ExtractExtended,
                Stage::RefineExtended, Stage::Combine,
                Stage::Cleanup};
    }
    return {Stage::Init,   Stage::ExtractNonOverlap, Stage::DtwAlign,
            Stage::Refine, Stage::Combine,           Stage::Cleanup};
}

float StageWeights::weight(Stage stage) const {
    switch (stage) {
    case Stage::Init:
        return init;
    case Stage::ExtractNonOverlap:
        return extract_non_overlap;
    case Stage::DtwAlign:
        return dtw_align;
    case Stage::Refine:
        return refine;
    case Stage::ExtractExtended:
        return extract_extended;
    case Stage::RefineExtended:
        return refine_extended;
    case Stage::Combine:
        return combine;
    case Stage::Cleanup:
        return cleanup;
    case Stage::Done:
        return 0.0f;
    }
    return 0.0f;
}

static bool is_probability(float p) { return p > 0.0f && p < 1.0f; }

void validate_config(const MergeConfig &config) {
    if (config.batch_size <= 0) {
        throw std::invalid_argument("batch_size must be positive, got " +
                                    std::to_string(config.batch_size));
    }
    if (config.refine.window < 1 || config.refine.extended_window < 1) {
        throw std::invalid_argument("refinement window must be at least 1");
    }
    if (config.refine.max_window_tokens < 1) {
        throw std::invalid_argument("max_window_tokens must be at least 1");
    }
    if (config.refine.split_penalty < 0.0f) {
        throw std::invalid_argument("split_penalty must not be negative");
    }
    if (config.dtw.band_radius < 1) {
        throw std::invalid_argument("dtw band_radius must be at least 1");
    }

    const auto &ext = config.extended;
    if (!is_probability(ext.hmm_stay) || !is_probability(ext.hmm_emit_aligned) ||
        !is_probability(ext.hmm_emit_unaligned)) {
        throw std::invalid_argument(
            "HMM parameters must lie strictly between 0 and 1");
    }
    if (ext.trim_threshold < ext.align_threshold) {
        throw std::invalid_argument(
            "trim_threshold must not be below align_threshold");
    }

    float sum = 0.0f;
    for (Stage stage : stage_sequence(config.mode)) {
        float w = config.weights.weight(stage);
        if (w < 0.0f) {
            throw std::invalid_argument(std::string("negative weight for stage ") +
                                        stage_name(stage));
        }
        sum += w;
    }
    if (std::fabs(sum - 1.0f) > 1e-4f) {
        throw std::invalid_argument("stage weights must sum to 1.0, got " +
                                    std::to_string(sum));
    }
}

} // namespace subalign
