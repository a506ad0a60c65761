#pragma once

#include <atomic>
#include <cstddef>
#include <functional>

#include "subalign/config.hpp"

namespace subalign {

// ─── Cancellation ────────────────────────────────────────────────────────────

// Shared stop flag. The caller sets it from any thread; the engine polls it
// between batches.
class CancellationToken {
  public:
    void cancel() { flag_.store(true, std::memory_order_relaxed); }
    void reset() { flag_.store(false, std::memory_order_relaxed); }
    bool cancelled() const { return flag_.load(std::memory_order_relaxed); }

  private:
    std::atomic<bool> flag_{false};
};

// Throws MergeCancelled if token is set. A null token never cancels.
void check_cancelled(const CancellationToken *token);

// ─── Stage Context ───────────────────────────────────────────────────────────

using ProgressCallback = std::function<void(float percent)>;

// Hooks handed to a pipeline component for the duration of one stage.
struct StageContext {
    const CancellationToken *cancel = nullptr;
    std::function<void(float)> progress; // stage-local fraction in [0, 1]

    void check() const { check_cancelled(cancel); }
    void report(float fraction) const;
    void report(size_t done, size_t total) const;
};

// ─── Progress Tracker ────────────────────────────────────────────────────────

// Weighted stage progress. Reported percentages never decrease and reach
// 100 exactly once finish_all() is called.
class ProgressTracker {
  public:
    ProgressTracker(const StageWeights &weights, ProgressCallback callback);

    // Enter a stage; the previous stage is credited in full.
    void begin(Stage stage);

    // Stage-local progress in [0, 1].
    void update(float fraction);

    // Credit a stage that does not run in this merge.
    void skip(Stage stage);

    void finish_all();

    float percent() const { return percent_; }
    Stage stage() const { return stage_; }

  private:
    StageWeights weights_;
    ProgressCallback callback_;
    Stage stage_ = Stage::Init;
    bool in_stage_ = false;
    float completed_ = 0.0f; // summed weight of finished stages
    float percent_ = 0.0f;

    void credit_current_();
    void report_(float percent);
};

} // namespace subalign
