#pragma once

#include <string>
#include <vector>

#include "subalign/types.hpp"

namespace subalign {

// ─── Track Validation ────────────────────────────────────────────────────────

// Throws InputError for an empty track or an entry with start > end.
// name is used in the message ("primary", "secondary").
void validate_track(const Track &track, const char *name);

// ─── Flat Token Sequences ────────────────────────────────────────────────────

// Build the flat token sequence of entries (already tokenized) and assign
// every entry its span into it.
FlatTokens flatten(std::vector<SubtitleEntry> &entries);

// Text for flat tokens [span.start, span.end). Tokens of one entry keep the
// entry's original spacing; tokens of different entries are joined with a
// single space, or directly after a line-break marker.
std::string join_tokens(const std::vector<SubtitleEntry> &entries,
                        const FlatTokens &flat, TokenSpan span);

// Style of the first token in span, empty for an empty span.
std::string span_style(const FlatTokens &flat, TokenSpan span);

// Every consecutive sub-span [a, b) of span, ordered by start then end.
std::vector<TokenSpan> consecutive_spans(TokenSpan span);

// Every span [points[a], points[b]) with a < b, in the same order.
std::vector<TokenSpan> spans_between(const std::vector<int> &points);

} // namespace subalign
