#include "overlay/core/config.h"
#include "overlay/core/logging.h"
#include "overlay/core/util.h"

#include <algorithm>

namespace {
    bool clampU32(std::uint32_t& v, std::uint32_t lo, std::uint32_t hi) {
        const std::uint32_t c = std::min(std::max(v, lo), hi);
        if (c == v) return false;
        v = c;
        return true;
    }

    // Non-finite or non-positive values fall back to the default.
    bool requirePositive(float& v, float fallback) {
        if (isFiniteF32(v) && v > 0.0f) return false;
        v = fallback;
        return true;
    }

    bool requireNonNegative(float& v, float fallback) {
        if (isFiniteF32(v) && v >= 0.0f) return false;
        v = fallback;
        return true;
    }
}

bool sanitizeConfig(OverlayConfig& config) {
    bool changed = false;

    changed |= clampU32(config.maxDepth, 1, 16);
    changed |= clampU32(config.leafCapacity, 1, 256);
    changed |= clampU32(config.stalenessThreshold, 1, 1u << 24);
    changed |= clampU32(config.overflowRebuildLimit, 1, 1u << 24);
    changed |= requirePositive(config.rootHalfExtent, defaultIndexRootHalfExtent);

    changed |= requirePositive(config.viewportWidth, defaultViewportWidth);
    changed |= requirePositive(config.viewportHeight, defaultViewportHeight);

    changed |= requireNonNegative(config.marginLowZoom, defaultMarginLowZoom);
    changed |= requireNonNegative(config.marginHighZoom, defaultMarginHighZoom);
    changed |= requirePositive(config.marginLowZoomScale, defaultMarginLowZoomScale);
    changed |= requirePositive(config.marginHighZoomScale, defaultMarginHighZoomScale);
    if (config.marginHighZoomScale <= config.marginLowZoomScale) {
        config.marginLowZoomScale = defaultMarginLowZoomScale;
        config.marginHighZoomScale = defaultMarginHighZoomScale;
        changed = true;
    }

    changed |= requirePositive(config.lodFullScale, defaultLodFullScale);
    changed |= requirePositive(config.lodReducedScale, defaultLodReducedScale);
    if (config.lodReducedScale > config.lodFullScale) {
        std::swap(config.lodReducedScale, config.lodFullScale);
        changed = true;
    }

    changed |= requireNonNegative(config.minPixelSize, defaultMinPixelSize);

    if (changed) {
        OVERLAY_LOG_WARN("config contained out-of-range values; clamped");
    }
    return changed;
}
