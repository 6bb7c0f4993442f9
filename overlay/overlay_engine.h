#pragma once

#include "overlay/core/config.h"
#include "overlay/core/types.h"
#include "overlay/frame/frame_clock.h"
#include "overlay/protocol/protocol_types.h"
#include "overlay/scene/scene_source.h"
#include "overlay/sync/value_sync.h"

#include <cstddef>
#include <cstdint>
#include <memory>

struct OverlayState;
class OverlayEngineTestAccessor;

// Sink for published frames. Called at the end of a tick that changed something.
class OverlayRenderer {
public:
    virtual ~OverlayRenderer() = default;
    virtual void onFrame(const overlay::protocol::FramePtr& frame) = 0;
};

// Keeps a reactive overlay in step with a non-reactive scene engine: mirrors
// its camera, tracks node lifecycles, culls through a spatial index and routes
// UI edits back to the engine.
class OverlayEngine {
    friend class OverlayEngineTestAccessor;
public:
    using ProtocolInfo = overlay::protocol::ProtocolInfo;
    using OverlayStats = overlay::protocol::OverlayStats;
    using FramePtr = overlay::protocol::FramePtr;
    using FeatureFlags = overlay::protocol::FeatureFlags;

    // Protocol versions (must be non-zero; keep in sync with the reactive layer).
    static constexpr std::uint32_t kProtocolVersion = 1;
    static constexpr std::uint32_t kSnapshotVersion = 1;
    static constexpr std::uint32_t kFeatureFlags =
        static_cast<std::uint32_t>(FeatureFlags::FEATURE_PROTOCOL)
        | static_cast<std::uint32_t>(FeatureFlags::FEATURE_LOD_HINTS)
        | static_cast<std::uint32_t>(FeatureFlags::FEATURE_FRAME_DIFF)
        | static_cast<std::uint32_t>(FeatureFlags::FEATURE_VALUE_SYNC)
        | static_cast<std::uint32_t>(FeatureFlags::FEATURE_WIDGET_OPTIONS);

    OverlayEngine(SceneSource& scene, FrameClock& clock, const OverlayConfig& config = OverlayConfig{});
    ~OverlayEngine();

    OverlayEngine(const OverlayEngine&) = delete;
    OverlayEngine& operator=(const OverlayEngine&) = delete;

    // Subscribes to the scene, adopts existing nodes and schedules the first frame.
    void attach();
    // Unsubscribes, cancels the pending frame and clears every store.
    void teardown();
    bool isAttached() const noexcept;

    void setConfig(const OverlayConfig& config);
    const OverlayConfig& config() const noexcept;
    void setViewportSize(float width, float height);

    void setRenderer(OverlayRenderer* renderer);
    // For hosts that cannot observe camera motion.
    void setContinuous(bool continuous);

    // Schedules a tick on the next display refresh (coalesced).
    void requestFrame();
    bool isFramePending() const noexcept;
    // Synchronous tick.
    void tickNow(double nowMs);

    FramePtr currentFrame() const;
    SnapshotPtr snapshot(NodeId id) const;
    const VisibilityState* visibility(NodeId id) const;

    FieldChangeHandler fieldChangeHandler(NodeId id, std::size_t fieldIndex) const;
    SyncResult applyFieldEdit(NodeId id, std::size_t fieldIndex, const FieldValue& value);

    Point2 sceneToOverlay(Point2 p) const;
    Point2 overlayToScene(Point2 p) const;

    ProtocolInfo getProtocolInfo() const noexcept {
        return ProtocolInfo{
            kProtocolVersion,
            kSnapshotVersion,
            kFeatureFlags
        };
    }

    OverlayStats getStats() const noexcept;

    OverlayError getLastError() const noexcept;
    void clearError() const noexcept;

private:
    OverlayState& state() noexcept { return *state_; }
    const OverlayState& state() const noexcept { return *state_; }
    void setError(OverlayError err) const noexcept;

    std::unique_ptr<OverlayState> state_;
};
