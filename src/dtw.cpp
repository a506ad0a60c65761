#include "subalign/dtw.hpp"

#include <algorithm>
#include <limits>

#include "subalign/track.hpp"

namespace subalign {

static constexpr float INF = std::numeric_limits<float>::infinity();

// ─── DtwBand ─────────────────────────────────────────────────────────────────

DtwBand DtwBand::full(int n, int m) {
    DtwBand band;
    band.lo.assign(static_cast<size_t>(n), 0);
    band.hi.assign(static_cast<size_t>(n), m);
    return band;
}

DtwBand DtwBand::around_diagonal(int n, int m, int radius) {
    // Wide enough that consecutive row windows always overlap
    int step = (m + n - 1) / std::max(n, 1);
    int r = std::max(radius, step + 1);
    if (r >= m)
        return full(n, m);

    DtwBand band;
    band.lo.resize(static_cast<size_t>(n));
    band.hi.resize(static_cast<size_t>(n));
    for (int i = 0; i < n; ++i) {
        long long center =
            n > 1 ? (static_cast<long long>(i) * (m - 1) + (n - 1) / 2) /
                        (n - 1)
                  : 0;
        band.lo[i] = static_cast<int>(std::max(0LL, center - r));
        band.hi[i] = static_cast<int>(std::min<long long>(m, center + r + 1));
    }
    band.lo[0] = 0;
    band.hi[n - 1] = m;
    return band;
}

long long DtwBand::cells() const {
    long long total = 0;
    for (size_t i = 0; i < lo.size(); ++i)
        total += hi[i] - lo[i];
    return total;
}

// ─── DtwMatrix ───────────────────────────────────────────────────────────────

DtwMatrix::DtwMatrix(const DtwBand &band, Workspace &workspace)
    : band_(band),
      acc_(workspace.floats(Workspace::Slot::DtwCost,
                            static_cast<size_t>(band.cells()))),
      n_(static_cast<int>(band.lo.size())),
      m_(band.hi.empty() ? 0 : band.hi.back()) {
    offset_.resize(static_cast<size_t>(n_));
    long long off = 0;
    for (int i = 0; i < n_; ++i) {
        offset_[i] = off;
        off += band_.hi[i] - band_.lo[i];
    }
}

float DtwMatrix::at_(int i, int j) const {
    if (i < 0 || j < 0)
        return INF;
    if (j < band_.lo[i] || j >= band_.hi[i])
        return INF;
    return acc_[offset_[i] + (j - band_.lo[i])];
}

void DtwMatrix::fill_row(int i, const float *cost) {
    int lo = band_.lo[i];
    int hi = band_.hi[i];
    float *row = acc_.data() + offset_[i];

    for (int j = lo; j < hi; ++j) {
        float c = cost[j - lo];
        if (i == 0 && j == 0) {
            row[0] = c;
            continue;
        }
        // Order fixes tie preference: diagonal, primary only, secondary only
        float best = at_(i - 1, j - 1);
        float up = at_(i - 1, j);
        if (up < best)
            best = up;
        float left = j > lo ? row[j - 1 - lo] : INF;
        if (left < best)
            best = left;
        row[j - lo] = c + best;
    }
}

float DtwMatrix::total_cost() const {
    if (n_ == 0 || m_ == 0)
        return 0.0f;
    return at_(n_ - 1, m_ - 1);
}

std::vector<std::pair<int, int>> DtwMatrix::path() const {
    std::vector<std::pair<int, int>> steps;
    if (n_ == 0 || m_ == 0)
        return steps;

    int i = n_ - 1;
    int j = m_ - 1;
    steps.emplace_back(i, j);
    while (i > 0 || j > 0) {
        float diag = at_(i - 1, j - 1);
        float up = at_(i - 1, j);
        float left = at_(i, j - 1);

        int di = -1, dj = -1;
        float best = diag;
        if (up < best) {
            best = up;
            di = -1;
            dj = 0;
        }
        if (left < best) {
            di = 0;
            dj = -1;
        }
        i += di;
        j += dj;
        steps.emplace_back(i, j);
    }
    std::reverse(steps.begin(), steps.end());
    return steps;
}

std::vector<std::pair<int, int>> dtw_path(const std::vector<float> &cost,
                                          int n, int m, Workspace &workspace) {
    if (n <= 0 || m <= 0)
        return {};
    DtwBand band = DtwBand::full(n, m);
    DtwMatrix acc(band, workspace);
    for (int i = 0; i < n; ++i)
        acc.fill_row(i, cost.data() + static_cast<size_t>(i) * m);
    return acc.path();
}

// ─── DtwAligner ──────────────────────────────────────────────────────────────

std::vector<std::vector<int>>
DtwAligner::align_tokens(const FlatTokens &primary, const FlatTokens &secondary,
                         EmbeddingCache &cache, const StageContext &ctx) {
    int n = static_cast<int>(primary.size());
    int m = static_cast<int>(secondary.size());
    std::vector<std::vector<int>> pairing(static_cast<size_t>(n));
    if (n == 0 || m == 0)
        return pairing;

    // Embed everything up front: first half of the stage
    std::vector<std::string> all = primary.texts;
    all.insert(all.end(), secondary.texts.begin(), secondary.texts.end());
    cache.prefetch(all, [&](float f) { ctx.report(0.5f * f); });

    long long cells = static_cast<long long>(n) * m;
    DtwBand band = cells > config_.full_matrix_limit
                       ? DtwBand::around_diagonal(n, m, config_.band_radius)
                       : DtwBand::full(n, m);
    DtwMatrix acc(band, workspace_);

    // Similarities are computed a block of rows at a time, restricted to the
    // columns the block's band touches.
    std::vector<float> cost;
    for (int r0 = 0; r0 < n; r0 += batch_size_) {
        ctx.check();
        int r1 = std::min(n, r0 + batch_size_);
        int c0 = band.lo[r0];
        int c1 = band.hi[r1 - 1];
        auto sim = cache.similarity_matrix(primary.texts, r0, r1,
                                           secondary.texts, c0, c1);
        int width = c1 - c0;

        for (int i = r0; i < r1; ++i) {
            int lo = band.lo[i];
            int hi = band.hi[i];
            cost.resize(static_cast<size_t>(hi - lo));
            const float *srow = sim.data() + static_cast<size_t>(i - r0) * width;
            for (int j = lo; j < hi; ++j)
                cost[j - lo] = 1.0f - srow[j - c0];
            acc.fill_row(i, cost.data());
        }
        ctx.report(0.5f + 0.5f * static_cast<float>(r1) / n);
    }

    for (const auto &[i, j] : acc.path())
        pairing[i].push_back(j);
    return pairing;
}

std::vector<MergedField>
group_by_entry(const std::vector<std::vector<int>> &pairing,
               const std::vector<SubtitleEntry> &primary_entries,
               const FlatTokens &primary,
               const std::vector<SubtitleEntry> &secondary_entries,
               const FlatTokens &secondary) {
    std::vector<MergedField> fields;
    fields.reserve(primary_entries.size());

    int prev_end = 0;
    for (const auto &e : primary_entries) {
        TokenSpan span{prev_end, prev_end};
        for (int k = e.span.start; k < e.span.end; ++k) {
            for (int j : pairing[k]) {
                if (span.empty()) {
                    span = {j, j + 1};
                } else {
                    span.start = std::min(span.start, j);
                    span.end = std::max(span.end, j + 1);
                }
            }
        }
        if (!span.empty())
            prev_end = span.end;

        MergedField f;
        f.start = e.start;
        f.end = e.end;
        f.primary_text = join_tokens(primary_entries, primary, e.span);
        f.primary_style = e.style;
        f.primary_span = e.span;
        f.secondary_span = span;
        f.secondary_text = join_tokens(secondary_entries, secondary, span);
        f.secondary_style = span_style(secondary, span);
        f.origin = FieldOrigin::Aligned;
        f.index = e.index;
        fields.push_back(std::move(f));
    }
    return fields;
}

std::vector<MergedField>
DtwAligner::align(const std::vector<SubtitleEntry> &primary_entries,
                  const FlatTokens &primary,
                  const std::vector<SubtitleEntry> &secondary_entries,
                  const FlatTokens &secondary, EmbeddingCache &cache,
                  const StageContext &ctx) {
    auto pairing = align_tokens(primary, secondary, cache, ctx);
    return group_by_entry(pairing, primary_entries, primary,
                          secondary_entries, secondary);
}

} // namespace subalign
