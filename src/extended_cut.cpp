#include "subalign/extended_cut.hpp"

#include <algorithm>
#include <cmath>

namespace subalign {

// ─── Aligned Mask ────────────────────────────────────────────────────────────

std::vector<int> aligned_mask(const std::vector<MergedField> &fields,
                              float threshold) {
    std::vector<int> mask(fields.size());
    for (size_t i = 0; i < fields.size(); ++i)
        mask[i] = fields[i].score > threshold ? 1 : 0;
    return mask;
}

std::vector<int> smooth_mask(const std::vector<int> &mask,
                             const ExtendedCutConfig &config,
                             Workspace &workspace) {
    const size_t T = mask.size();
    std::vector<int> states(T, 1);
    if (T == 0)
        return states;

    const float log_stay = std::log(config.hmm_stay);
    const float log_switch = std::log(1.0f - config.hmm_stay);
    // emit[state][observation]
    const float emit[2][2] = {
        {std::log(config.hmm_emit_unaligned),
         std::log(1.0f - config.hmm_emit_unaligned)},
        {std::log(1.0f - config.hmm_emit_aligned),
         std::log(config.hmm_emit_aligned)},
    };

    // score[t * 2 + s], back[t * 2 + s]
    auto &score = workspace.floats(Workspace::Slot::HmmScore, T * 2);
    auto &back = workspace.ints(Workspace::Slot::HmmScore, T * 2);

    const float log_init = std::log(0.5f);
    for (int s = 0; s < 2; ++s) {
        score[s] = log_init + emit[s][mask[0]];
        back[s] = s;
    }

    for (size_t t = 1; t < T; ++t) {
        int obs = mask[t];
        for (int s = 0; s < 2; ++s) {
            float from_aligned =
                score[(t - 1) * 2 + 1] + (s == 1 ? log_stay : log_switch);
            float from_unaligned =
                score[(t - 1) * 2 + 0] + (s == 0 ? log_stay : log_switch);
            if (from_aligned >= from_unaligned) {
                score[t * 2 + s] = from_aligned + emit[s][obs];
                back[t * 2 + s] = 1;
            } else {
                score[t * 2 + s] = from_unaligned + emit[s][obs];
                back[t * 2 + s] = 0;
            }
        }
    }

    int s = score[(T - 1) * 2 + 1] >= score[(T - 1) * 2 + 0] ? 1 : 0;
    for (size_t t = T; t-- > 0;) {
        states[t] = s;
        s = back[t * 2 + s];
    }
    return states;
}

std::vector<FieldRun> unaligned_runs(const std::vector<int> &states) {
    std::vector<FieldRun> runs;
    bool in_run = false;
    int run_start = 0;
    int T = static_cast<int>(states.size());

    for (int t = 0; t < T; ++t) {
        bool unaligned = states[t] == 0;
        if (unaligned && !in_run) {
            run_start = t;
            in_run = true;
        } else if (!unaligned && in_run) {
            runs.push_back({run_start, t});
            in_run = false;
        }
    }
    if (in_run) {
        runs.push_back({run_start, T});
    }
    return runs;
}

// ─── ExtendedCutExtractor ────────────────────────────────────────────────────

float ExtendedCutExtractor::border_score_(const MergedField &field,
                                          const MergedField *neighbour) {
    float s = field.score;
    if (neighbour) {
        s = std::max(s, cache_.similarity(field.primary_text,
                                          neighbour->secondary_text));
    }
    return s;
}

FieldRun ExtendedCutExtractor::trim_(const std::vector<MergedField> &fields,
                                     const std::vector<int> &states,
                                     FieldRun run) {
    // Nearest aligned field holding secondary text, searching from pos by step
    auto neighbour = [&](int pos, int step) -> const MergedField * {
        for (int k = pos; k >= 0 && k < static_cast<int>(fields.size());
             k += step) {
            if (states[k] == 1 && !fields[k].secondary_span.empty())
                return &fields[k];
        }
        return nullptr;
    };
    const MergedField *before = neighbour(run.start - 1, -1);
    const MergedField *after = neighbour(run.end, 1);

    bool changed = true;
    while (changed && !run.empty()) {
        changed = false;
        if (border_score_(fields[run.start], before) >
            config_.trim_threshold) {
            ++run.start;
            changed = true;
        }
        if (!run.empty() &&
            border_score_(fields[run.end - 1], after) >
                config_.trim_threshold) {
            --run.end;
            changed = true;
        }
    }
    return run;
}

ExtendedCutResult ExtendedCutExtractor::extract(std::vector<MergedField> fields,
                                                const StageContext &ctx) {
    ExtendedCutResult result;
    auto mask = aligned_mask(fields, config_.align_threshold);
    auto states = smooth_mask(mask, config_, workspace_);
    // A field that matches its own secondary text above trim_threshold is
    // never an extension; it splits the run around it and anchors trimming.
    for (size_t k = 0; k < fields.size(); ++k) {
        if (fields[k].score > config_.trim_threshold)
            states[k] = 1;
    }
    auto runs = unaligned_runs(states);

    std::vector<char> extended(fields.size(), 0);
    bool any = false;
    for (size_t r = 0; r < runs.size(); ++r) {
        ctx.check();
        FieldRun kept = trim_(fields, states, runs[r]);
        for (int k = kept.start; k < kept.end; ++k) {
            extended[k] = 1;
            any = true;
        }
        ctx.report(r + 1, runs.size());
    }

    if (!any) {
        result.aligned = std::move(fields);
        ctx.report(1.0f);
        return result;
    }

    for (size_t k = 0; k < fields.size(); ++k) {
        auto &f = fields[k];
        if (!extended[k]) {
            result.aligned.push_back(std::move(f));
            continue;
        }
        f.origin = FieldOrigin::Extended;
        f.secondary_text.clear();
        f.secondary_style.clear();
        f.secondary_span = {f.secondary_span.start, f.secondary_span.start};
        f.score = 0.0f;
        result.extended.push_back(std::move(f));
    }
    ctx.report(1.0f);
    return result;
}

} // namespace subalign
