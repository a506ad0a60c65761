#include "subalign/newline.hpp"

#include "subalign/tokenizer.hpp"

namespace subalign {

static std::string trim(const std::string &s) {
    const char *ws = " \t\r\f\v";
    size_t first = s.find_first_not_of(ws);
    if (first == std::string::npos)
        return {};
    size_t last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

std::string clean_newlines(const std::string &text, bool retain) {
    std::vector<std::string> segments;
    std::string current;
    for (size_t i = 0; i < text.size();) {
        if (size_t bl = detail::line_break_at(text, i)) {
            segments.push_back(trim(current));
            current.clear();
            i += bl;
            continue;
        }
        current += text[i++];
    }
    segments.push_back(trim(current));

    const char *sep = retain ? LINE_BREAK : " ";
    std::string out;
    for (const auto &seg : segments) {
        if (seg.empty())
            continue;
        if (!out.empty())
            out += sep;
        out += seg;
    }
    return out;
}

void clean_newlines(std::vector<MergedField> &fields, bool retain,
                    const StageContext &ctx) {
    constexpr size_t CHECK_EVERY = 256;
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i % CHECK_EVERY == 0) {
            ctx.check();
            ctx.report(i, fields.size());
        }
        fields[i].primary_text = clean_newlines(fields[i].primary_text, retain);
        fields[i].secondary_text =
            clean_newlines(fields[i].secondary_text, retain);
    }
    ctx.report(1.0f);
}

} // namespace subalign
