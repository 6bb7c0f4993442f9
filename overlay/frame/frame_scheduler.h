#pragma once

#include "overlay/frame/frame_clock.h"

#include <cstdint>

// The per-tick work, in the order the scheduler runs it.
class FramePipeline {
public:
    virtual ~FramePipeline() = default;
    virtual void mirrorTransform() = 0;
    virtual void detectDirty() = 0;
    virtual void updateIndex() = 0;
    virtual void recomputeVisibility() = 0;
    virtual void publish() = 0;
};

enum class FramePhase : std::uint8_t {
    MirrorTransform = 0,
    DetectDirty = 1,
    UpdateIndex = 2,
    RecomputeVisibility = 3,
    Publish = 4,
};

const char* framePhaseName(FramePhase phase);

// Coalesces tick requests into one callback per display refresh.
class FrameScheduler {
public:
    FrameScheduler(FrameClock& clock, FramePipeline& pipeline);
    ~FrameScheduler();

    FrameScheduler(const FrameScheduler&) = delete;
    FrameScheduler& operator=(const FrameScheduler&) = delete;

    // No-op while a tick is already pending.
    void requestTick();
    void cancel();
    bool isPending() const noexcept { return pending_ != invalidFrameRequest; }

    // Re-arm after every tick.
    void setContinuous(bool continuous);
    bool isContinuous() const noexcept { return continuous_; }

    // Synchronous tick; a pending request is cancelled first.
    void runNow(double nowMs);

    std::uint32_t tickCount() const noexcept { return ticks_; }
    std::uint32_t failedTicks() const noexcept { return failedTicks_; }
    float lastTickMs() const noexcept { return lastTickMs_; }
    double lastFrameTime() const noexcept { return lastFrameTime_; }

private:
    void onFrame(double nowMs);
    void tick(double nowMs);

    FrameClock& clock_;
    FramePipeline& pipeline_;
    FrameRequestId pending_{invalidFrameRequest};
    bool continuous_{false};
    bool ticking_{false};
    std::uint32_t ticks_{0};
    std::uint32_t failedTicks_{0};
    float lastTickMs_{0.0f};
    double lastFrameTime_{0.0};
};
