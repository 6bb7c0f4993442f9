#include "overlay/transform/transform_mirror.h"
#include "overlay/core/logging.h"
#include "overlay/core/util.h"

#include <cstdio>

namespace {
    TransformWarning classify(const Camera& camera) {
        if (!isFiniteF32(camera.scale)) return TransformWarning::NonFiniteScale;
        if (camera.scale <= 0.0f) return TransformWarning::NonPositiveScale;
        if (!isFiniteF32(camera.offsetX) || !isFiniteF32(camera.offsetY)) return TransformWarning::NonFiniteOffset;
        return TransformWarning::None;
    }
}

bool isValidTransform(const ViewTransform& t) {
    return isFiniteF32(t.scale) && t.scale > 0.0f && isFiniteF32(t.offsetX) && isFiniteF32(t.offsetY);
}

Point2 sceneToOverlay(const ViewTransform& t, Point2 p) {
    // Offset is applied before scaling.
    return Point2{(p.x + t.offsetX) * t.scale, (p.y + t.offsetY) * t.scale};
}

Point2 overlayToScene(const ViewTransform& t, Point2 p) {
    return Point2{p.x / t.scale - t.offsetX, p.y / t.scale - t.offsetY};
}

AABB sceneToOverlay(const ViewTransform& t, const AABB& bounds) {
    const Point2 a = sceneToOverlay(t, Point2{bounds.minX, bounds.minY});
    const Point2 b = sceneToOverlay(t, Point2{bounds.maxX, bounds.maxY});
    return AABB{a.x, a.y, b.x, b.y};
}

AffineMatrix composeMatrix(const ViewTransform& t) {
    return AffineMatrix{t.scale, 0.0f, 0.0f, t.scale, t.offsetX * t.scale, t.offsetY * t.scale};
}

void TransformMirror::reset() noexcept {
    current_ = ViewTransform{};
    lastWarning_ = TransformWarning::None;
    warningCount_ = 0;
    generation_ = 0;
}

bool TransformMirror::update(const Camera& camera) {
    const TransformWarning warning = classify(camera);
    if (warning != TransformWarning::None) {
        lastWarning_ = warning;
        warningCount_++;
        OVERLAY_LOG_WARN("invalid camera (scale=%f offset=%f,%f); keeping last transform",
            static_cast<double>(camera.scale),
            static_cast<double>(camera.offsetX),
            static_cast<double>(camera.offsetY));
        return false;
    }

    lastWarning_ = TransformWarning::None;
    if (camera.scale == current_.scale && camera.offsetX == current_.offsetX && camera.offsetY == current_.offsetY) {
        return false;
    }

    current_ = ViewTransform{camera.scale, camera.offsetX, camera.offsetY};
    generation_++;
    return true;
}

std::string TransformMirror::toCssTransform() const {
    const AffineMatrix m = matrix();
    char buf[160];
    std::snprintf(buf, sizeof(buf), "matrix(%g, %g, %g, %g, %g, %g)",
        static_cast<double>(m.a), static_cast<double>(m.b),
        static_cast<double>(m.c), static_cast<double>(m.d),
        static_cast<double>(m.e), static_cast<double>(m.f));
    return std::string(buf);
}
