#include "subalign/track.hpp"

#include <string>

#include "subalign/errors.hpp"
#include "subalign/tokenizer.hpp"

namespace subalign {

void validate_track(const Track &track, const char *name) {
    if (track.entries.empty()) {
        throw InputError(std::string(name) + " track has no entries");
    }
    for (size_t i = 0; i < track.entries.size(); ++i) {
        const auto &e = track.entries[i];
        if (e.start > e.end) {
            throw InputError(std::string(name) + " entry " +
                             std::to_string(i) + " ends before it starts (" +
                             std::to_string(e.start) + " > " +
                             std::to_string(e.end) + ")");
        }
    }
}

FlatTokens flatten(std::vector<SubtitleEntry> &entries) {
    FlatTokens flat;
    size_t total = 0;
    for (const auto &e : entries)
        total += e.tokens.size();
    flat.texts.reserve(total);
    flat.styles.reserve(total);
    flat.owner.reserve(total);
    flat.position.reserve(total);

    for (size_t i = 0; i < entries.size(); ++i) {
        auto &e = entries[i];
        e.span.start = static_cast<int>(flat.size());
        for (size_t k = 0; k < e.tokens.size(); ++k) {
            flat.texts.push_back(e.tokens[k].text);
            flat.styles.push_back(e.style);
            flat.owner.push_back(static_cast<int>(i));
            flat.position.push_back(static_cast<int>(k));
        }
        e.span.end = static_cast<int>(flat.size());
    }
    return flat;
}

static bool ends_with_break(const std::string &text) {
    const std::string marker = LINE_BREAK;
    return text.size() >= marker.size() &&
           text.compare(text.size() - marker.size(), marker.size(), marker) ==
               0;
}

std::string join_tokens(const std::vector<SubtitleEntry> &entries,
                        const FlatTokens &flat, TokenSpan span) {
    if (span.empty())
        return {};

    std::string out;
    int k = span.start;
    while (k < span.end) {
        // Run of tokens owned by the same entry
        int owner = flat.owner[k];
        int run_end = k + 1;
        while (run_end < span.end && flat.owner[run_end] == owner &&
               flat.position[run_end] == flat.position[run_end - 1] + 1)
            ++run_end;

        const auto &entry = entries[owner];
        auto first = static_cast<size_t>(flat.position[k]);
        auto last = static_cast<size_t>(flat.position[run_end - 1]) + 1;
        std::string piece = reconstruct(entry.text, entry.tokens, first, last);

        if (!out.empty() && !ends_with_break(out))
            out += ' ';
        out += piece;
        k = run_end;
    }
    return out;
}

std::string span_style(const FlatTokens &flat, TokenSpan span) {
    if (span.empty() || span.start >= static_cast<int>(flat.size()))
        return {};
    return flat.styles[span.start];
}

std::vector<TokenSpan> spans_between(const std::vector<int> &points) {
    std::vector<TokenSpan> out;
    size_t n = points.size();
    if (n < 2)
        return out;
    out.reserve(n * (n - 1) / 2);
    for (size_t a = 0; a < n; ++a) {
        for (size_t b = a + 1; b < n; ++b) {
            out.push_back({points[a], points[b]});
        }
    }
    return out;
}

std::vector<TokenSpan> consecutive_spans(TokenSpan span) {
    std::vector<int> points;
    for (int p = span.start; p <= span.end; ++p)
        points.push_back(p);
    return spans_between(points);
}

} // namespace subalign
