#pragma once

#include <cstddef>
#include <vector>

#include "subalign/config.hpp"
#include "subalign/embedding.hpp"
#include "subalign/progress.hpp"
#include "subalign/tokenizer.hpp"
#include "subalign/types.hpp"

namespace subalign {

// ─── Merge Result ────────────────────────────────────────────────────────────

struct MergeStats {
    size_t primary_entries = 0;
    size_t secondary_entries = 0;
    size_t primary_tokens = 0;
    size_t secondary_tokens = 0;

    size_t non_overlap_primary = 0;   // carried over as PrimaryOnly
    size_t non_overlap_secondary = 0; // carried over as SecondaryOnly
    size_t aligned = 0;
    size_t extended = 0;

    int refine_passes = 0;
    size_t provider_calls = 0;
    size_t embedded_strings = 0;
    Stage final_stage = Stage::Init;
};

struct MergeResult {
    std::vector<MergedField> fields; // sorted by (start, end, index)
    StyleTable primary_styles;
    StyleTable secondary_styles;
    MergeStats stats;
};

// ─── High-Level Merge API ────────────────────────────────────────────────────

/// Align a secondary subtitle track to a primary one by meaning rather than
/// timing, and return one merged, time-ordered track.
///
///   subalign::Merger merger(provider);
///   auto result = merger.merge(primary, secondary);
///   for (const auto &f : result.fields)
///       std::cout << f.primary_text << " | " << f.secondary_text << "\n";
///
/// The provider is borrowed and must outlive the Merger. A Merger may run
/// several merges one after another but is not thread-safe.
class Merger {
  public:
    /// Throws std::invalid_argument if config is inconsistent.
    explicit Merger(EmbeddingProvider &provider,
                    const MergeConfig &config = make_synced_config(),
                    const LanguageDetector *detector = nullptr);

    /// Run the whole pipeline. Throws InputError for an empty or malformed
    /// track, ProviderError when embedding fails and MergeCancelled when
    /// cancel is set. on_progress receives non-decreasing percentages
    /// ending at 100.
    MergeResult merge(const Track &primary, const Track &secondary,
                      ProgressCallback on_progress = {},
                      const CancellationToken *cancel = nullptr);

    const MergeConfig &config() const { return config_; }

  private:
    EmbeddingProvider &provider_;
    MergeConfig config_;
    const LanguageDetector *detector_;
};

} // namespace subalign
