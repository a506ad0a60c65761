#include "subalign/tokenizer.hpp"

#include <algorithm>
#include <cctype>

namespace subalign {

// ─── Language / Script ───────────────────────────────────────────────────────

bool is_non_space_language(const std::string &code) {
    // Primary subtag only: "zh-Hant" → "zh"
    std::string lang;
    for (char c : code) {
        if (c == '-' || c == '_')
            break;
        lang += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    static const char *const NON_SPACE[] = {"zh", "ja", "th", "lo", "km",
                                            "my", "bo", "dz", "yue"};
    return std::any_of(std::begin(NON_SPACE), std::end(NON_SPACE),
                       [&](const char *c) { return lang == c; });
}

TokenRule rule_for_language(const std::optional<std::string> &code) {
    if (!code || code->empty() || is_non_space_language(*code))
        return TokenRule::NonSpaceSeparated;
    return TokenRule::SpaceSeparated;
}

// ─── Character Classes ───────────────────────────────────────────────────────

namespace detail {

char32_t decode_utf8(const std::string &s, size_t pos, size_t &len) {
    auto byte = [&](size_t i) { return static_cast<unsigned char>(s[i]); };
    unsigned char b0 = byte(pos);
    size_t n = 0;
    char32_t cp = 0;
    if (b0 < 0x80) {
        len = 1;
        return b0;
    } else if ((b0 & 0xE0) == 0xC0) {
        n = 2;
        cp = b0 & 0x1F;
    } else if ((b0 & 0xF0) == 0xE0) {
        n = 3;
        cp = b0 & 0x0F;
    } else if ((b0 & 0xF8) == 0xF0) {
        n = 4;
        cp = b0 & 0x07;
    } else {
        len = 1;
        return 0xFFFD;
    }
    if (pos + n > s.size()) {
        len = 1;
        return 0xFFFD;
    }
    for (size_t k = 1; k < n; ++k) {
        unsigned char b = byte(pos + k);
        if ((b & 0xC0) != 0x80) {
            len = 1;
            return 0xFFFD;
        }
        cp = (cp << 6) | (b & 0x3F);
    }
    len = n;
    return cp;
}

bool is_boundary_punct(char32_t cp) {
    switch (cp) {
    case U'.':
    case U',':
    case U'!':
    case U'?':
    case U':':
    case U';':
    case 0x2026: // ellipsis
    case 0x203C: // double exclamation
    case 0x2047:
    case 0x2048:
    case 0x2049:
    // CJK
    case 0x3001:
    case 0x3002:
    case 0x30FB:
    case 0xFF01:
    case 0xFF0C:
    case 0xFF0E:
    case 0xFF1A:
    case 0xFF1B:
    case 0xFF1F:
    case 0xFF61:
    case 0xFF64:
    case 0xFF65:
    // Arabic / Urdu
    case 0x060C:
    case 0x061B:
    case 0x061F:
    case 0x06D4:
    // Devanagari danda
    case 0x0964:
    case 0x0965:
    // Myanmar, Khmer
    case 0x104A:
    case 0x104B:
    case 0x17D4:
    case 0x17D5:
        return true;
    default:
        return false;
    }
}

bool is_space(char32_t cp) {
    if (cp == U' ' || cp == U'\t' || cp == U'\r' || cp == U'\f' ||
        cp == U'\v')
        return true;
    if (cp == 0x00A0 || cp == 0x3000 || cp == 0x202F || cp == 0x205F)
        return true;
    return cp >= 0x2000 && cp <= 0x200A;
}

bool is_dash(char32_t cp) {
    return cp == U'-' || cp == 0x2013 || cp == 0x2014;
}

size_t line_break_at(const std::string &s, size_t pos) {
    if (s[pos] == '\n')
        return 1;
    if (s[pos] == '\\' && pos + 1 < s.size() &&
        (s[pos + 1] == 'N' || s[pos + 1] == 'n'))
        return 2;
    return 0;
}

} // namespace detail

// ─── Tokenizer ───────────────────────────────────────────────────────────────

Tokenizer Tokenizer::for_track(const Track &track,
                               const LanguageDetector *detector) {
    if (!detector)
        return Tokenizer(TokenRule::NonSpaceSeparated);

    std::string all_text;
    for (const auto &e : track.entries) {
        if (!all_text.empty())
            all_text += ' ';
        all_text += e.text;
    }
    return Tokenizer(rule_for_language(detector->detect(all_text)));
}

static bool is_dash_only(const std::string &text) {
    if (text.empty())
        return false;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t len = 0;
        if (!detail::is_dash(detail::decode_utf8(text, pos, len)))
            return false;
        pos += len;
    }
    return true;
}

// Fuse dialogue dashes ("-", "–", "—") with the token that follows them.
static std::vector<Token> combine_leading_dash(const std::string &line,
                                               std::vector<Token> tokens) {
    std::vector<Token> out;
    out.reserve(tokens.size());
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (i + 1 < tokens.size() && !tokens[i].line_break &&
            is_dash_only(tokens[i].text)) {
            Token merged = tokens[i + 1];
            merged.text = reconstruct(line, tokens, i, i + 2);
            merged.begin = tokens[i].begin;
            out.push_back(std::move(merged));
            ++i;
            continue;
        }
        out.push_back(std::move(tokens[i]));
    }
    return out;
}

std::vector<Token> Tokenizer::tokenize(const std::string &text) const {
    using namespace detail;

    std::vector<Token> tokens;
    const size_t n = text.size();

    bool open = false;
    size_t tok_begin = 0;
    size_t tok_end = 0; // end of the last non-space byte

    auto close = [&]() {
        if (!open)
            return;
        Token t;
        t.text = text.substr(tok_begin, tok_end - tok_begin);
        t.begin = tok_begin;
        t.end = tok_end;
        tokens.push_back(std::move(t));
        open = false;
    };

    size_t i = 0;
    while (i < n) {
        // Explicit line break: always a boundary, kept on the previous token
        if (size_t bl = line_break_at(text, i)) {
            close();
            if (!tokens.empty()) {
                Token &prev = tokens.back();
                prev.text += LINE_BREAK;
                prev.line_break = true;
                prev.end = i + bl;
            }
            i += bl;
            continue;
        }

        size_t len = 0;
        char32_t cp = decode_utf8(text, i, len);

        if (is_space(cp)) {
            if (rule_ == TokenRule::NonSpaceSeparated && open) {
                // Whitespace splits, unless punctuation follows it
                size_t j = i;
                while (j < n && !line_break_at(text, j)) {
                    size_t l = 0;
                    if (!is_space(decode_utf8(text, j, l)))
                        break;
                    j += l;
                }
                size_t l = 0;
                bool punct_next = j < n && !line_break_at(text, j) &&
                                  is_boundary_punct(decode_utf8(text, j, l));
                if (!punct_next)
                    close();
                i = j;
                continue;
            }
            i += len;
            continue;
        }

        if (is_boundary_punct(cp)) {
            if (!open) {
                open = true;
                tok_begin = i;
            }
            // A punctuation run ends the token
            while (i < n && !line_break_at(text, i)) {
                size_t l = 0;
                if (!is_boundary_punct(decode_utf8(text, i, l)))
                    break;
                i += l;
            }
            tok_end = i;
            close();
            continue;
        }

        if (!open) {
            open = true;
            tok_begin = i;
        }
        i += len;
        tok_end = i;
    }
    close();

    return combine_leading_dash(text, std::move(tokens));
}

void Tokenizer::tokenize(std::vector<SubtitleEntry> &entries) const {
    for (auto &e : entries) {
        e.tokens = tokenize(e.text);
    }
}

std::string reconstruct(const std::string &line,
                        const std::vector<Token> &tokens, size_t first,
                        size_t last) {
    last = std::min(last, tokens.size());
    if (first >= last)
        return {};

    std::string out = tokens[first].text;
    for (size_t k = first + 1; k < last; ++k) {
        const Token &prev = tokens[k - 1];
        const Token &cur = tokens[k];
        if (cur.begin > prev.end) {
            out.append(line, prev.end, cur.begin - prev.end);
        }
        out += cur.text;
    }
    return out;
}

} // namespace subalign
