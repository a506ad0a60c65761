#pragma once

#include <string>
#include <vector>

namespace subalign {

// ─── Tokens ──────────────────────────────────────────────────────────────────

// Explicit line-break marker used in normalized token and field text.
inline constexpr const char *LINE_BREAK = "\\N";

struct Token {
    std::string text;        // normalized text, trailing "\N" if line_break
    size_t begin = 0;        // byte offset in the source line
    size_t end = 0;          // one past the last byte (marker included)
    bool line_break = false; // token was followed by an explicit break
};

// Half-open [start, end) range into a flat token sequence.
struct TokenSpan {
    int start = 0;
    int end = 0;

    bool empty() const { return end <= start; }
    int size() const { return empty() ? 0 : end - start; }

    bool operator==(const TokenSpan &other) const {
        return start == other.start && end == other.end;
    }
};

// ─── Subtitle Entries ────────────────────────────────────────────────────────

struct SubtitleEntry {
    int start = 0; // ms
    int end = 0;   // ms
    std::string text;
    std::string style;
    int index = 0; // position in the source track

    // Filled by tokenization / flattening
    std::vector<Token> tokens;
    TokenSpan span;
};

struct Style {
    std::string name;
    std::string definition; // opaque, owned by the external writer
};

using StyleTable = std::vector<Style>;

struct Track {
    std::vector<SubtitleEntry> entries;
    StyleTable styles;
};

// Flat token sequence of one track. Index k describes the k-th token.
struct FlatTokens {
    std::vector<std::string> texts;
    std::vector<std::string> styles;
    std::vector<int> owner;    // position of the owning entry
    std::vector<int> position; // token index inside the owning entry

    size_t size() const { return texts.size(); }
    bool empty() const { return texts.empty(); }
};

// ─── Merged Output ───────────────────────────────────────────────────────────

enum class FieldOrigin {
    Aligned,       // primary entry paired by semantic alignment
    PrimaryOnly,   // primary entry without time overlap
    SecondaryOnly, // secondary entry without time overlap
    Extended,      // primary-only span of an extended cut
};

struct MergedField {
    int start = 0; // ms
    int end = 0;   // ms
    std::string primary_text;
    std::string secondary_text;
    std::string primary_style;
    std::string secondary_style;

    TokenSpan primary_span;
    TokenSpan secondary_span;
    float score = 0.0f; // cosine similarity of the final pairing
    FieldOrigin origin = FieldOrigin::Aligned;
    int index = 0; // original sequence index, tie-break for ordering
};

// (start, end, index) ordering used by the combine step.
inline bool field_time_less(const MergedField &a, const MergedField &b) {
    if (a.start != b.start)
        return a.start < b.start;
    if (a.end != b.end)
        return a.end < b.end;
    return a.index < b.index;
}

} // namespace subalign
