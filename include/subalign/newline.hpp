#pragma once

#include <string>
#include <vector>

#include "subalign/progress.hpp"
#include "subalign/types.hpp"

namespace subalign {

// ─── Newline Cleanup ─────────────────────────────────────────────────────────

// Normalize line-break markers ("\N", "\n" literal or a raw newline) in one
// text. Segments between markers are trimmed and empty ones dropped, so
// markers at either end and repeated markers disappear. With retain the
// remaining segments are joined by "\N", otherwise by a single space.
std::string clean_newlines(const std::string &text, bool retain);

// Apply clean_newlines to both sides of every field, in place.
void clean_newlines(std::vector<MergedField> &fields, bool retain,
                    const StageContext &ctx);

} // namespace subalign
