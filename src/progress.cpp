#include "subalign/progress.hpp"

#include <algorithm>
#include <utility>

#include "subalign/errors.hpp"

namespace subalign {

void check_cancelled(const CancellationToken *token) {
    if (token && token->cancelled()) {
        throw MergeCancelled();
    }
}

// ─── Stage Context ───────────────────────────────────────────────────────────

void StageContext::report(float fraction) const {
    if (progress) {
        progress(std::clamp(fraction, 0.0f, 1.0f));
    }
}

void StageContext::report(size_t done, size_t total) const {
    report(total == 0 ? 1.0f
                      : static_cast<float>(done) / static_cast<float>(total));
}

// ─── Progress Tracker ────────────────────────────────────────────────────────

ProgressTracker::ProgressTracker(const StageWeights &weights,
                                 ProgressCallback callback)
    : weights_(weights), callback_(std::move(callback)) {}

void ProgressTracker::credit_current_() {
    if (in_stage_) {
        completed_ += weights_.weight(stage_);
        in_stage_ = false;
    }
}

void ProgressTracker::begin(Stage stage) {
    credit_current_();
    stage_ = stage;
    in_stage_ = true;
    report_(completed_ * 100.0f);
}

void ProgressTracker::update(float fraction) {
    if (!in_stage_)
        return;
    fraction = std::clamp(fraction, 0.0f, 1.0f);
    report_((completed_ + weights_.weight(stage_) * fraction) * 100.0f);
}

void ProgressTracker::skip(Stage stage) {
    credit_current_();
    stage_ = stage;
    completed_ += weights_.weight(stage);
    report_(completed_ * 100.0f);
}

void ProgressTracker::finish_all() {
    credit_current_();
    stage_ = Stage::Done;
    report_(100.0f);
}

void ProgressTracker::report_(float percent) {
    // Float accumulation may land a hair off 100; clamp and keep monotone.
    percent = std::clamp(percent, 0.0f, 100.0f);
    if (stage_ != Stage::Done) {
        percent = std::min(percent, 99.999f);
    }
    if (percent < percent_)
        return;
    percent_ = percent;
    if (callback_) {
        callback_(percent_);
    }
}

} // namespace subalign
