#include "subalign/merger.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

#include "subalign/dtw.hpp"
#include "subalign/extended_cut.hpp"
#include "subalign/newline.hpp"
#include "subalign/non_overlap.hpp"
#include "subalign/refiner.hpp"
#include "subalign/track.hpp"
#include "subalign/workspace.hpp"

namespace subalign {

Merger::Merger(EmbeddingProvider &provider, const MergeConfig &config,
               const LanguageDetector *detector)
    : provider_(provider), config_(config), detector_(detector) {
    validate_config(config_);
}

// Entries of one side with nothing left to align against.
static std::vector<MergedField>
one_sided_fields(const std::vector<SubtitleEntry> &entries,
                 bool input_is_primary) {
    std::vector<MergedField> fields;
    fields.reserve(entries.size());
    for (const auto &e : entries) {
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
        fields.push_back(std::move(f));
    }
    return fields;
}

static void append(std::vector<MergedField> &out,
                   std::vector<MergedField> &&more) {
    out.insert(out.end(), std::make_move_iterator(more.begin()),
               std::make_move_iterator(more.end()));
}

MergeResult Merger::merge(const Track &primary, const Track &secondary,
                          ProgressCallback on_progress,
                          const CancellationToken *cancel) {
    validate_track(primary, "primary");
    validate_track(secondary, "secondary");

    const bool cuts = config_.mode == MergeMode::Cuts;
    ProgressTracker tracker(config_.weights, std::move(on_progress));
    StageContext ctx{cancel, [&tracker](float f) { tracker.update(f); }};
    MergeResult result;
    MergeStats &stats = result.stats;

    // 1. Init: copy, index and tokenize both tracks
    tracker.begin(Stage::Init);
    stats.final_stage = Stage::Init;
    ctx.check();

    auto p_entries = primary.entries;
    auto s_entries = secondary.entries;
    for (size_t i = 0; i < p_entries.size(); ++i)
        p_entries[i].index = static_cast<int>(i);
    for (size_t i = 0; i < s_entries.size(); ++i)
        s_entries[i].index = static_cast<int>(i);

    Tokenizer::for_track(primary, detector_).tokenize(p_entries);
    ctx.report(0.5f);
    Tokenizer::for_track(secondary, detector_).tokenize(s_entries);
    stats.primary_entries = p_entries.size();
    stats.secondary_entries = s_entries.size();
    stats.primary_tokens = flatten(p_entries).size();
    stats.secondary_tokens = flatten(s_entries).size();
    ctx.report(1.0f);

    // 2. Time-disjoint entries bypass alignment
    std::vector<MergedField> carried;
    if (!cuts) {
        if (config_.ignore_non_overlap_filter) {
            tracker.skip(Stage::ExtractNonOverlap);
        } else {
            tracker.begin(Stage::ExtractNonOverlap);
            stats.final_stage = Stage::ExtractNonOverlap;
            ctx.check();
            auto p_ref = intervals_of(s_entries);
            auto s_ref = intervals_of(p_entries);
            auto p_split = extract_non_overlap(p_entries, p_ref, true);
            ctx.report(0.5f);
            auto s_split = extract_non_overlap(s_entries, s_ref, false);

            stats.non_overlap_primary = p_split.fields.size();
            stats.non_overlap_secondary = s_split.fields.size();
            append(carried, std::move(p_split.fields));
            append(carried, std::move(s_split.fields));
            p_entries = std::move(p_split.residual);
            s_entries = std::move(s_split.residual);
            ctx.report(1.0f);
        }
    }

    FlatTokens p_flat = flatten(p_entries);
    FlatTokens s_flat = flatten(s_entries);
    EmbeddingCache cache(provider_, config_.batch_size, cancel);
    Workspace workspace;

    // 3. Coarse token alignment over the residual entries
    tracker.begin(Stage::DtwAlign);
    stats.final_stage = Stage::DtwAlign;
    std::vector<MergedField> aligned;
    if (p_entries.empty()) {
        append(carried, one_sided_fields(s_entries, false));
    } else if (s_entries.empty()) {
        append(carried, one_sided_fields(p_entries, true));
    } else {
        DtwAligner aligner(config_.dtw, config_.batch_size, workspace);
        aligned = aligner.align(p_entries, p_flat, s_entries, s_flat, cache,
                                ctx);
    }

    // 4. Window refinement
    tracker.begin(Stage::Refine);
    stats.final_stage = Stage::Refine;
    WindowRefiner refiner(config_.refine, cache);
    int stage_number = 0;
    if (!aligned.empty()) {
        auto refined = refiner.refine(std::move(aligned), s_entries, s_flat,
                                      config_.refine.window, stage_number, ctx);
        aligned = std::move(refined.fields);
        stage_number = refined.stage_number;
    }

    // 5. Extended cut: peel primary-only runs, refine what is left
    std::vector<MergedField> extended;
    if (cuts) {
        tracker.begin(Stage::ExtractExtended);
        stats.final_stage = Stage::ExtractExtended;
        if (!aligned.empty()) {
            ExtendedCutExtractor extractor(config_.extended, cache, workspace);
            auto split = extractor.extract(std::move(aligned), ctx);
            aligned = std::move(split.aligned);
            extended = std::move(split.extended);
        }

        tracker.begin(Stage::RefineExtended);
        stats.final_stage = Stage::RefineExtended;
        if (!aligned.empty()) {
            auto refined = refiner.refine(
                std::move(aligned), s_entries, s_flat,
                config_.refine.extended_window, stage_number, ctx);
            aligned = std::move(refined.fields);
            stage_number = refined.stage_number;
        }
    }
    stats.refine_passes = stage_number;
    stats.aligned = aligned.size();
    stats.extended = extended.size();

    // 6. Combine by time
    tracker.begin(Stage::Combine);
    stats.final_stage = Stage::Combine;
    ctx.check();
    auto &fields = result.fields;
    fields.reserve(carried.size() + aligned.size() + extended.size());
    append(fields, std::move(carried));
    append(fields, std::move(aligned));
    append(fields, std::move(extended));
    std::stable_sort(fields.begin(), fields.end(), field_time_less);
    ctx.report(1.0f);

    // 7. Cleanup
    tracker.begin(Stage::Cleanup);
    stats.final_stage = Stage::Cleanup;
    clean_newlines(fields, config_.retain_newline, ctx);

    result.primary_styles = primary.styles;
    result.secondary_styles = secondary.styles;
    stats.provider_calls = cache.provider_calls();
    stats.embedded_strings = cache.size();
    stats.final_stage = Stage::Done;
    tracker.finish_all();
    return result;
}

} // namespace subalign
