#pragma once

#include <optional>
#include <string>
#include <vector>

#include "subalign/types.hpp"

namespace subalign {

// ─── Language / Script ───────────────────────────────────────────────────────

enum class TokenRule {
    SpaceSeparated,    // split on punctuation only
    NonSpaceSeparated, // split on punctuation and on whitespace runs
};

// Detects the language of a block of text. Implemented outside the engine.
class LanguageDetector {
  public:
    virtual ~LanguageDetector() = default;

    // ISO 639-1 style code ("en", "zh-Hant", ...), or nullopt if unknown.
    virtual std::optional<std::string>
    detect(const std::string &text) const = 0;
};

// True for languages written without explicit word delimiters.
bool is_non_space_language(const std::string &code);

// Unknown language falls back to the non-space rule.
TokenRule rule_for_language(const std::optional<std::string> &code);

// ─── Tokenizer ───────────────────────────────────────────────────────────────

class Tokenizer {
  public:
    explicit Tokenizer(TokenRule rule = TokenRule::NonSpaceSeparated)
        : rule_(rule) {}

    // Pick the rule once for a whole track from its concatenated text.
    // A null detector behaves like an unknown language.
    static Tokenizer for_track(const Track &track,
                               const LanguageDetector *detector);

    // Split one line. Empty text yields no tokens.
    std::vector<Token> tokenize(const std::string &text) const;

    // Tokenize every entry in place.
    void tokenize(std::vector<SubtitleEntry> &entries) const;

    TokenRule rule() const { return rule_; }

  private:
    TokenRule rule_;
};

// Rebuild the text of tokens [first, last) of one line, reusing the line's
// original spacing between tokens.
std::string reconstruct(const std::string &line,
                        const std::vector<Token> &tokens, size_t first,
                        size_t last);

namespace detail {

// Decode one UTF-8 code point at pos; len receives its byte length.
// Malformed bytes decode as U+FFFD with length 1.
char32_t decode_utf8(const std::string &s, size_t pos, size_t &len);

bool is_boundary_punct(char32_t cp);
bool is_space(char32_t cp);
bool is_dash(char32_t cp);

// Byte length of a line-break marker at pos ("\n", "\N", "\n" literal), or 0.
size_t line_break_at(const std::string &s, size_t pos);

} // namespace detail

} // namespace subalign
