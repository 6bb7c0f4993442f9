#include "overlay/frame/frame_scheduler.h"
#include "overlay/core/logging.h"
#include "overlay/core/util.h"

#include <exception>

const char* framePhaseName(FramePhase phase) {
    switch (phase) {
        case FramePhase::MirrorTransform:     return "mirror-transform";
        case FramePhase::DetectDirty:         return "detect-dirty";
        case FramePhase::UpdateIndex:         return "update-index";
        case FramePhase::RecomputeVisibility: return "recompute-visibility";
        case FramePhase::Publish:             return "publish";
    }
    return "unknown";
}

FrameScheduler::FrameScheduler(FrameClock& clock, FramePipeline& pipeline)
    : clock_(clock), pipeline_(pipeline) {}

FrameScheduler::~FrameScheduler() {
    cancel();
}

void FrameScheduler::requestTick() {
    if (isPending()) return;
    pending_ = clock_.requestFrame([this](double nowMs) { onFrame(nowMs); });
}

void FrameScheduler::cancel() {
    if (!isPending()) return;
    clock_.cancelFrame(pending_);
    pending_ = invalidFrameRequest;
}

void FrameScheduler::setContinuous(bool continuous) {
    continuous_ = continuous;
    if (continuous_) requestTick();
}

void FrameScheduler::runNow(double nowMs) {
    cancel();
    tick(nowMs);
    if (continuous_) requestTick();
}

void FrameScheduler::onFrame(double nowMs) {
    pending_ = invalidFrameRequest;
    tick(nowMs);
    if (continuous_) requestTick();
}

void FrameScheduler::tick(double nowMs) {
    if (ticking_) {
        // A phase asked for a synchronous tick; defer it to the next frame.
        requestTick();
        return;
    }
    ticking_ = true;
    const double t0 = emscripten_get_now();
    try {
        pipeline_.mirrorTransform();
        pipeline_.detectDirty();
        pipeline_.updateIndex();
        pipeline_.recomputeVisibility();
        pipeline_.publish();
    } catch (const std::exception& e) {
        OVERLAY_LOG_WARN("tick %u aborted: %s", ticks_, e.what());
        failedTicks_++;
    } catch (...) {
        OVERLAY_LOG_WARN("tick %u aborted by a non-standard exception", ticks_);
        failedTicks_++;
    }
    lastTickMs_ = static_cast<float>(emscripten_get_now() - t0);
    lastFrameTime_ = nowMs;
    ticks_++;
    ticking_ = false;
}
