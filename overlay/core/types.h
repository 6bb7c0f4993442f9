#ifndef NODEOVERLAY_CORE_TYPES_H
#define NODEOVERLAY_CORE_TYPES_H

#include <cstdint>
#include <cstddef>
#include <algorithm>

// Lightweight types and constants shared by the overlay core.

using NodeId = std::uint32_t;
static constexpr NodeId invalidNodeId = 0;

// Spatial index defaults
static constexpr std::uint32_t defaultIndexMaxDepth = 8;
static constexpr std::uint32_t defaultIndexLeafCapacity = 12;
static constexpr std::uint32_t defaultIndexStalenessThreshold = 1024;
static constexpr std::uint32_t defaultIndexOverflowRebuildLimit = 64;
static constexpr float defaultIndexRootHalfExtent = 8192.0f;

// Visibility defaults
static constexpr float defaultViewportWidth = 800.0f;
static constexpr float defaultViewportHeight = 600.0f;
static constexpr float defaultMarginLowZoom = 0.5f;
static constexpr float defaultMarginHighZoom = 0.1f;
static constexpr float defaultMarginLowZoomScale = 0.25f;
static constexpr float defaultMarginHighZoomScale = 2.0f;
static constexpr float defaultLodFullScale = 0.8f;
static constexpr float defaultLodReducedScale = 0.4f;
static constexpr float defaultMinPixelSize = 2.0f;

struct Point2 { float x; float y; };

// Axis-aligned bounds in scene space (min/max form, like the pick index).
struct AABB {
    float minX, minY, maxX, maxY;
};

inline AABB makeBounds(float x, float y, float w, float h) {
    return AABB{x, y, x + w, y + h};
}

// Touching edges count as intersecting so zero-sized entries are never lost.
inline bool intersects(const AABB& a, const AABB& b) {
    return a.minX <= b.maxX && a.maxX >= b.minX && a.minY <= b.maxY && a.maxY >= b.minY;
}

inline bool containsBounds(const AABB& outer, const AABB& inner) {
    return inner.minX >= outer.minX && inner.maxX <= outer.maxX
        && inner.minY >= outer.minY && inner.maxY <= outer.maxY;
}

inline bool sameBounds(const AABB& a, const AABB& b) {
    return a.minX == b.minX && a.minY == b.minY && a.maxX == b.maxX && a.maxY == b.maxY;
}

inline AABB unionBounds(const AABB& a, const AABB& b) {
    return AABB{
        std::min(a.minX, b.minX),
        std::min(a.minY, b.minY),
        std::max(a.maxX, b.maxX),
        std::max(a.maxY, b.maxY)
    };
}

enum class LodTier : std::uint8_t {
    Minimal = 0,
    Reduced = 1,
    Full = 2,
};

enum class OverlayError : std::uint8_t {
    Ok = 0,
    ExtractionFailed = 1,
    IndexInconsistent = 2,
    InvalidTransform = 3,
    CallbackFailed = 4,
    UnknownNode = 5,
    UnknownField = 6,
    TypeMismatch = 7,
    InvalidConfig = 8,
};

#endif // NODEOVERLAY_CORE_TYPES_H
