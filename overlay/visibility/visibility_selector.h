#pragma once

#include "overlay/bridge/lifecycle_bridge.h"
#include "overlay/core/config.h"
#include "overlay/core/types.h"
#include "overlay/spatial/quad_tree.h"
#include "overlay/transform/transform_mirror.h"

#include <cstdint>
#include <vector>

// What a renderer should draw for a tier. Snapshots stay complete at every tier.
struct LodDetail {
    bool showFields;
    bool showSecondaryFields;
    bool showPreviews;
    bool showConnectorLabels;
};

struct VisibilityResult {
    std::vector<VisibleEntry> visible;
    AABB queryRect{0.0f, 0.0f, 0.0f, 0.0f}; // scene space
    std::uint32_t candidates{0};
    std::uint32_t tooSmall{0};
};

float marginFraction(float scale, const OverlayConfig& config);
// Viewport grown by the margin on every side, mapped back to scene space.
AABB expandedSceneRect(const ViewTransform& transform, const OverlayConfig& config);
LodTier lodForScale(float scale, const OverlayConfig& config);
LodDetail detailForTier(LodTier tier);
const char* lodTierName(LodTier tier);

class VisibilitySelector {
public:
    explicit VisibilitySelector(const OverlayConfig& config = OverlayConfig{}) : config_(config) {}

    void setConfig(const OverlayConfig& config) { config_ = config; }
    const OverlayConfig& config() const noexcept { return config_; }

    // Visible entries come back sorted by node id.
    void compute(const ViewTransform& transform, const QuadTree& index, VisibilityResult& result) const;

private:
    OverlayConfig config_;
};
