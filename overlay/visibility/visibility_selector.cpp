#include "overlay/visibility/visibility_selector.h"

#include <algorithm>

float marginFraction(float scale, const OverlayConfig& config) {
    if (scale <= config.marginLowZoomScale) return config.marginLowZoom;
    if (scale >= config.marginHighZoomScale) return config.marginHighZoom;
    const float t = (scale - config.marginLowZoomScale) / (config.marginHighZoomScale - config.marginLowZoomScale);
    return config.marginLowZoom + (config.marginHighZoom - config.marginLowZoom) * t;
}

AABB expandedSceneRect(const ViewTransform& transform, const OverlayConfig& config) {
    const float margin = marginFraction(transform.scale, config);
    const float mx = config.viewportWidth * margin;
    const float my = config.viewportHeight * margin;
    const Point2 a = overlayToScene(transform, Point2{-mx, -my});
    const Point2 b = overlayToScene(transform, Point2{config.viewportWidth + mx, config.viewportHeight + my});
    return AABB{std::min(a.x, b.x), std::min(a.y, b.y), std::max(a.x, b.x), std::max(a.y, b.y)};
}

LodTier lodForScale(float scale, const OverlayConfig& config) {
    if (scale > config.lodFullScale) return LodTier::Full;
    if (scale >= config.lodReducedScale) return LodTier::Reduced;
    return LodTier::Minimal;
}

LodDetail detailForTier(LodTier tier) {
    switch (tier) {
        case LodTier::Full:    return LodDetail{true, true, true, true};
        case LodTier::Reduced: return LodDetail{true, false, false, true};
        case LodTier::Minimal: return LodDetail{false, false, false, false};
    }
    return LodDetail{false, false, false, false};
}

const char* lodTierName(LodTier tier) {
    switch (tier) {
        case LodTier::Full:    return "full";
        case LodTier::Reduced: return "reduced";
        case LodTier::Minimal: return "minimal";
    }
    return "minimal";
}

void VisibilitySelector::compute(const ViewTransform& transform, const QuadTree& index, VisibilityResult& result) const {
    result.visible.clear();
    result.candidates = 0;
    result.tooSmall = 0;
    result.queryRect = expandedSceneRect(transform, config_);

    std::vector<NodeId> hits;
    index.query(result.queryRect, hits);
    result.candidates = static_cast<std::uint32_t>(hits.size());

    const LodTier tier = lodForScale(transform.scale, config_);
    result.visible.reserve(hits.size());
    for (const NodeId id : hits) {
        const AABB* bounds = index.boundsOf(id);
        if (!bounds) continue;
        const float extent = std::max(bounds->maxX - bounds->minX, bounds->maxY - bounds->minY);
        if (extent * transform.scale < config_.minPixelSize) {
            result.tooSmall++;
            continue;
        }
        result.visible.push_back(VisibleEntry{id, tier});
    }
    std::sort(result.visible.begin(), result.visible.end(),
        [](const VisibleEntry& a, const VisibleEntry& b) { return a.id < b.id; });
}
