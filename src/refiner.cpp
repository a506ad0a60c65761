#include "subalign/refiner.hpp"

#include <algorithm>

#include "subalign/track.hpp"

namespace subalign {

// ─── Span Bookkeeping ────────────────────────────────────────────────────────

void normalize_spans(std::vector<MergedField> &fields) {
    int prev_end = 0;
    for (auto &f : fields) {
        TokenSpan span = f.secondary_span;
        if (!span.empty())
            span.start = std::max(span.start, prev_end);
        if (span.empty()) {
            span = {prev_end, prev_end};
        } else {
            prev_end = span.end;
        }
        f.secondary_span = span;
    }
}

void absorb_leftovers(std::vector<MergedField> &fields, int total) {
    if (fields.empty())
        return;

    int last = -1;
    for (size_t i = 0; i < fields.size(); ++i) {
        auto &span = fields[i].secondary_span;
        if (span.empty())
            continue;
        if (last < 0) {
            span.start = 0;
        } else {
            fields[last].secondary_span.end = span.start;
        }
        last = static_cast<int>(i);
    }

    if (last < 0) {
        fields[0].secondary_span = {0, total};
    } else {
        auto &tail = fields[last].secondary_span;
        tail.end = std::max(tail.end, total);
    }

    // Empty spans sit where the previous span ended
    int prev_end = 0;
    for (auto &f : fields) {
        if (f.secondary_span.empty()) {
            f.secondary_span = {prev_end, prev_end};
        } else {
            prev_end = f.secondary_span.end;
        }
    }
}

std::vector<TokenSpan>
best_partition_at(const std::vector<int> &points, int parts,
                  const std::function<float(int, TokenSpan)> &score,
                  const std::function<float(int)> &cut_cost) {
    int lo = points.empty() ? 0 : points.front();
    std::vector<TokenSpan> out(static_cast<size_t>(std::max(parts, 0)),
                               TokenSpan{lo, lo});
    if (parts <= 0 || points.size() < 2)
        return out;

    const int units = static_cast<int>(points.size()) - 1;
    auto span = [&](int s, int e) { return TokenSpan{points[s], points[e]}; };
    auto cost = [&](int e) {
        return cut_cost && e > 0 && e < units ? cut_cost(points[e]) : 0.0f;
    };

    // best[k][s]: best total for fields k.. when field k starts at points[s]
    // cut[k][s]:  index of the point where field k then ends
    std::vector<std::vector<float>> best(static_cast<size_t>(parts),
                                         std::vector<float>(units + 1, 0.0f));
    std::vector<std::vector<int>> cut(static_cast<size_t>(parts),
                                      std::vector<int>(units + 1, units));

    for (int s = 0; s <= units; ++s) {
        best[parts - 1][s] = s < units ? score(parts - 1, span(s, units)) : 0.0f;
    }
    for (int k = parts - 2; k >= 0; --k) {
        for (int s = 0; s <= units; ++s) {
            float top = 0.0f;
            int top_e = -1;
            // Descending end with strict > keeps the longest optimal span
            for (int e = units; e >= s; --e) {
                float v = (e > s ? score(k, span(s, e)) : 0.0f) +
                          best[k + 1][e] - cost(e);
                if (top_e < 0 || v > top) {
                    top = v;
                    top_e = e;
                }
            }
            best[k][s] = top;
            cut[k][s] = top_e;
        }
    }

    int s = 0;
    for (int k = 0; k < parts; ++k) {
        int e = k + 1 < parts ? cut[k][s] : units;
        out[k] = span(s, e);
        s = e;
    }
    return out;
}

std::vector<TokenSpan>
best_partition(TokenSpan span, int parts,
               const std::function<float(int, TokenSpan)> &score,
               const std::function<float(int)> &cut_cost) {
    std::vector<int> points;
    for (int p = span.start; p <= std::max(span.start, span.end); ++p)
        points.push_back(p);
    return best_partition_at(points, parts, score, cut_cost);
}

// ─── WindowRefiner ───────────────────────────────────────────────────────────

RefineResult
WindowRefiner::refine(std::vector<MergedField> fields,
                      const std::vector<SubtitleEntry> &secondary_entries,
                      const FlatTokens &secondary, int window,
                      int stage_number, const StageContext &ctx) {
    normalize_spans(fields);
    absorb_leftovers(fields, static_cast<int>(secondary.size()));

    size_t n = fields.size();
    size_t w = std::min(static_cast<size_t>(std::max(window, 1)), n);
    size_t windows = n == 0 ? 0 : n - w + 1;

    for (size_t i = 0; i < windows; ++i) {
        ctx.check();
        refine_window_(fields, i, w, secondary_entries, secondary);
        ctx.report(0.9f * static_cast<float>(i + 1) /
                   static_cast<float>(windows));
    }

    rescore_(fields, secondary_entries, secondary, ctx);
    ctx.report(1.0f);
    return {std::move(fields), stage_number + 1};
}

std::vector<int>
WindowRefiner::cut_points_(const std::vector<MergedField> &fields,
                           size_t first, size_t count, TokenSpan region,
                           const FlatTokens &secondary) const {
    std::vector<int> points;
    if (region.size() <= config_.max_window_tokens) {
        for (int p = region.start; p <= region.end; ++p)
            points.push_back(p);
        return points;
    }

    // Current boundaries always stay reachable
    points = {region.start, region.end};
    for (size_t k = 1; k < count; ++k) {
        int p = fields[first + k].secondary_span.start;
        points.push_back(std::clamp(p, region.start, region.end));
    }
    std::sort(points.begin(), points.end());
    points.erase(std::unique(points.begin(), points.end()), points.end());

    std::vector<int> lines;
    for (int p = region.start + 1; p < region.end; ++p) {
        if (secondary.owner[p] != secondary.owner[p - 1] &&
            !std::binary_search(points.begin(), points.end(), p))
            lines.push_back(p);
    }

    // Thin line boundaries evenly until the unit count fits
    int room = config_.max_window_tokens - static_cast<int>(points.size() - 1);
    size_t keep = static_cast<size_t>(std::max(room, 0));
    if (lines.size() <= keep) {
        points.insert(points.end(), lines.begin(), lines.end());
    } else {
        for (size_t i = 0; i < keep; ++i)
            points.push_back(lines[(2 * i + 1) * lines.size() / (2 * keep)]);
    }
    std::sort(points.begin(), points.end());
    return points;
}

void WindowRefiner::refine_window_(
    std::vector<MergedField> &fields, size_t first, size_t count,
    const std::vector<SubtitleEntry> &secondary_entries,
    const FlatTokens &secondary) {
    TokenSpan region{fields[first].secondary_span.start,
                     fields[first + count - 1].secondary_span.end};
    if (region.empty())
        return;

    auto points = cut_points_(fields, first, count, region, secondary);
    auto combos = spans_between(points);
    std::vector<std::string> texts;
    texts.reserve(combos.size());
    for (const auto &c : combos)
        texts.push_back(join_tokens(secondary_entries, secondary, c));

    std::vector<std::string> rows;
    rows.reserve(count);
    for (size_t k = 0; k < count; ++k)
        rows.push_back(fields[first + k].primary_text);

    auto sim = cache_.similarity_matrix(rows, texts); // (count, combos)

    // Point index of every boundary, and where its combos start in texts
    const size_t units = points.size() - 1;
    std::vector<size_t> index_of(static_cast<size_t>(region.size()) + 1, 0);
    std::vector<size_t> start_offset(points.size(), 0);
    size_t off = 0;
    for (size_t a = 0; a < points.size(); ++a) {
        index_of[points[a] - region.start] = a;
        start_offset[a] = off;
        off += units - a;
    }

    auto score = [&](int k, TokenSpan s) {
        size_t a = index_of[s.start - region.start];
        size_t b = index_of[s.end - region.start];
        size_t id = start_offset[a] + (b - a - 1);
        return sim[static_cast<size_t>(k) * combos.size() + id];
    };
    // Splitting one secondary line between two fields
    auto split_cost = [&](int p) {
        return secondary.owner[p] == secondary.owner[p - 1]
                   ? config_.split_penalty
                   : 0.0f;
    };

    auto parts = best_partition_at(points, static_cast<int>(count), score,
                                   split_cost);
    for (size_t k = 0; k < count; ++k)
        fields[first + k].secondary_span = parts[k];
}

void WindowRefiner::rescore_(
    std::vector<MergedField> &fields,
    const std::vector<SubtitleEntry> &secondary_entries,
    const FlatTokens &secondary, const StageContext &ctx) {
    std::vector<std::string> texts;
    for (auto &f : fields) {
        f.secondary_text =
            join_tokens(secondary_entries, secondary, f.secondary_span);
        f.secondary_style = span_style(secondary, f.secondary_span);
        if (!f.secondary_span.empty()) {
            texts.push_back(f.primary_text);
            texts.push_back(f.secondary_text);
        }
    }

    ctx.check();
    cache_.prefetch(texts);
    for (auto &f : fields) {
        f.score = f.secondary_span.empty()
                      ? 0.0f
                      : cache_.similarity(f.primary_text, f.secondary_text);
    }
}

} // namespace subalign
