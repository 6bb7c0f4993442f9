#pragma once

#include "overlay/core/types.h"
#include "overlay/scene/scene_source.h"

#include <cstdint>
#include <string>

// Overlay transform: screen = (scene + offset) * scale.
struct ViewTransform {
    float scale{1.0f};
    float offsetX{0.0f};
    float offsetY{0.0f};
};

// 2D affine in CSS matrix() order: x' = a*x + c*y + e, y' = b*x + d*y + f.
struct AffineMatrix {
    float a, b, c, d, e, f;
};

enum class TransformWarning : std::uint8_t {
    None = 0,
    NonFiniteScale = 1,
    NonPositiveScale = 2,
    NonFiniteOffset = 3,
};

bool isValidTransform(const ViewTransform& t);

Point2 sceneToOverlay(const ViewTransform& t, Point2 p);
Point2 overlayToScene(const ViewTransform& t, Point2 p);
AABB sceneToOverlay(const ViewTransform& t, const AABB& bounds);
AffineMatrix composeMatrix(const ViewTransform& t);

class TransformMirror {
public:
    TransformMirror() = default;

    void reset() noexcept;

    // Validates and adopts the camera. Invalid cameras keep the last good
    // transform and raise a warning. Returns true when the transform changed.
    bool update(const Camera& camera);

    const ViewTransform& current() const noexcept { return current_; }
    AffineMatrix matrix() const { return composeMatrix(current_); }
    std::string toCssTransform() const;

    Point2 sceneToOverlay(Point2 p) const { return ::sceneToOverlay(current_, p); }
    AABB sceneToOverlay(const AABB& bounds) const { return ::sceneToOverlay(current_, bounds); }
    Point2 overlayToScene(Point2 p) const { return ::overlayToScene(current_, p); }

    bool hasWarning() const noexcept { return lastWarning_ != TransformWarning::None; }
    TransformWarning lastWarning() const noexcept { return lastWarning_; }
    std::uint32_t warningCount() const noexcept { return warningCount_; }
    std::uint32_t generation() const noexcept { return generation_; }

private:
    ViewTransform current_{};
    TransformWarning lastWarning_{TransformWarning::None};
    std::uint32_t warningCount_{0};
    std::uint32_t generation_{0};
};
