#pragma once

#include "overlay/bridge/lifecycle_bridge.h"
#include "overlay/core/config.h"
#include "overlay/core/types.h"
#include "overlay/frame/frame_clock.h"
#include "overlay/frame/frame_scheduler.h"
#include "overlay/protocol/protocol_types.h"
#include "overlay/scene/scene_source.h"
#include "overlay/spatial/quad_tree.h"
#include "overlay/sync/value_sync.h"
#include "overlay/transform/transform_mirror.h"
#include "overlay/visibility/visibility_selector.h"

#include <cstdint>
#include <unordered_map>

class OverlayRenderer;

QuadTreeOptions indexOptionsFor(const OverlayConfig& config);

// Everything the facade owns. Member order is construction order: the index
// outlives the bridge, the bridge outlives the value sync, and the scheduler
// is destroyed first so no frame fires into a half-destroyed state.
struct OverlayState : public FramePipeline {
    OverlayState(SceneSource& scene, FrameClock& clock, const OverlayConfig& config);
    ~OverlayState() override;

    OverlayState(const OverlayState&) = delete;
    OverlayState& operator=(const OverlayState&) = delete;

    // FramePipeline
    void mirrorTransform() override;
    void detectDirty() override;
    void updateIndex() override;
    void recomputeVisibility() override;
    void publish() override;

    void resetFrame();

    SceneSource& scene_;
    FrameClock& clock_;
    OverlayConfig config_;

    TransformMirror mirror_;
    QuadTree index_;
    NodeLifecycleBridge bridge_;
    ValueSync sync_;
    VisibilitySelector selector_;

    OverlayRenderer* renderer_{nullptr};
    bool attached_{false};

    // Per-tick scratch
    bool transformChanged_{false};
    DirtyReport dirty_{};
    VisibilityResult visibility_{};

    overlay::protocol::FramePtr frame_;
    std::unordered_map<NodeId, SnapshotPtr> published_;
    bool forcePublish_{true};

    std::uint32_t refreshedLastTick_{0};
    std::uint32_t rendererFailures_{0};
    std::uint32_t seenWarnings_{0};
    std::uint32_t seenExtractionErrors_{0};
    std::uint32_t seenRebuilds_{0};

    mutable OverlayError lastError{OverlayError::Ok};

    FrameScheduler scheduler_;
};
