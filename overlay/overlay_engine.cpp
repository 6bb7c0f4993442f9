#include "overlay/overlay_engine.h"
#include "overlay/core/logging.h"
#include "overlay/internal/overlay_state.h"

#include <memory>

QuadTreeOptions indexOptionsFor(const OverlayConfig& config) {
    QuadTreeOptions options;
    options.maxDepth = config.maxDepth;
    options.leafCapacity = config.leafCapacity;
    options.stalenessThreshold = config.stalenessThreshold;
    options.overflowRebuildLimit = config.overflowRebuildLimit;
    options.rootHalfExtent = config.rootHalfExtent;
    return options;
}

namespace {
    bool sameIndexOptions(const QuadTreeOptions& a, const QuadTreeOptions& b) {
        return a.maxDepth == b.maxDepth
            && a.leafCapacity == b.leafCapacity
            && a.stalenessThreshold == b.stalenessThreshold
            && a.overflowRebuildLimit == b.overflowRebuildLimit
            && a.rootHalfExtent == b.rootHalfExtent;
    }
}

OverlayState::OverlayState(SceneSource& scene, FrameClock& clock, const OverlayConfig& config)
    : scene_(scene),
      clock_(clock),
      config_(config),
      index_(indexOptionsFor(config)),
      bridge_(scene, index_),
      sync_(scene, bridge_),
      selector_(config),
      frame_(std::make_shared<const overlay::protocol::OverlayFrame>()),
      scheduler_(clock, *this) {
    bridge_.setEventHook([this](NodeId) {
        if (attached_) scheduler_.requestTick();
    });
    sync_.setEditListener([this](NodeId) { scheduler_.requestTick(); });
}

OverlayState::~OverlayState() {
    scheduler_.cancel();
    bridge_.setEventHook(nullptr);
    sync_.setEditListener(nullptr);
}

void OverlayState::resetFrame() {
    frame_ = std::make_shared<const overlay::protocol::OverlayFrame>();
    published_.clear();
    dirty_ = DirtyReport{};
    visibility_ = VisibilityResult{};
    transformChanged_ = false;
    forcePublish_ = true;
    refreshedLastTick_ = 0;
}

OverlayEngine::OverlayEngine(SceneSource& scene, FrameClock& clock, const OverlayConfig& config) {
    OverlayConfig sanitized = config;
    const bool changed = sanitizeConfig(sanitized);
    state_ = std::make_unique<OverlayState>(scene, clock, sanitized);
    if (changed) setError(OverlayError::InvalidConfig);
}

OverlayEngine::~OverlayEngine() {
    teardown();
}

void OverlayEngine::attach() {
    OverlayState& s = state();
    if (s.attached_) return;
    s.attached_ = true;
    s.forcePublish_ = true;
    s.bridge_.attach();
    s.scheduler_.requestTick();
    OVERLAY_LOG_DEBUG("overlay attached (%zu nodes)", s.bridge_.trackedCount());
}

void OverlayEngine::teardown() {
    OverlayState& s = state();
    s.scheduler_.setContinuous(false);
    s.scheduler_.cancel();
    s.sync_.clear();
    s.bridge_.detach();
    s.index_.clear();
    s.mirror_.reset();
    s.seenWarnings_ = 0;
    s.resetFrame();
    if (s.attached_) OVERLAY_LOG_DEBUG("overlay torn down");
    s.attached_ = false;
}

bool OverlayEngine::isAttached() const noexcept {
    return state().attached_;
}

void OverlayEngine::setConfig(const OverlayConfig& config) {
    OverlayState& s = state();
    OverlayConfig sanitized = config;
    if (sanitizeConfig(sanitized)) {
        setError(OverlayError::InvalidConfig);
    }
    const QuadTreeOptions options = indexOptionsFor(sanitized);
    s.config_ = sanitized;
    if (!sameIndexOptions(options, s.index_.options())) {
        s.index_.setOptions(options);
    }
    s.selector_.setConfig(sanitized);
    s.forcePublish_ = true;
    if (s.attached_) s.scheduler_.requestTick();
}

const OverlayConfig& OverlayEngine::config() const noexcept {
    return state().config_;
}

void OverlayEngine::setViewportSize(float width, float height) {
    OverlayConfig next = state().config_;
    next.viewportWidth = width;
    next.viewportHeight = height;
    setConfig(next);
}

void OverlayEngine::setRenderer(OverlayRenderer* renderer) {
    state().renderer_ = renderer;
}

void OverlayEngine::setContinuous(bool continuous) {
    state().scheduler_.setContinuous(continuous);
}

void OverlayEngine::requestFrame() {
    state().scheduler_.requestTick();
}

bool OverlayEngine::isFramePending() const noexcept {
    return state().scheduler_.isPending();
}

void OverlayEngine::tickNow(double nowMs) {
    state().scheduler_.runNow(nowMs);
}

OverlayEngine::FramePtr OverlayEngine::currentFrame() const {
    return state().frame_;
}

SnapshotPtr OverlayEngine::snapshot(NodeId id) const {
    return state().bridge_.snapshot(id);
}

const VisibilityState* OverlayEngine::visibility(NodeId id) const {
    return state().bridge_.visibility(id);
}

Point2 OverlayEngine::sceneToOverlay(Point2 p) const {
    return state().mirror_.sceneToOverlay(p);
}

Point2 OverlayEngine::overlayToScene(Point2 p) const {
    return state().mirror_.overlayToScene(p);
}

OverlayEngine::OverlayStats OverlayEngine::getStats() const noexcept {
    const OverlayState& s = state();
    const QuadTreeStats index = s.index_.getStats();
    const std::uint32_t tracked = static_cast<std::uint32_t>(s.bridge_.trackedCount());
    const std::uint32_t visible = static_cast<std::uint32_t>(s.frame_->nodes.size());
    return OverlayStats{
        s.scheduler_.tickCount(),
        s.scheduler_.failedTicks(),
        s.frame_->generation,
        tracked,
        visible,
        tracked > visible ? tracked - visible : 0,
        s.refreshedLastTick_,
        s.bridge_.extractionErrors(),
        s.mirror_.warningCount(),
        index.rebuildCount,
        index.deepestLevel,
        s.sync_.editCount(),
        s.sync_.rejectedCount(),
        s.sync_.callbackFailures() + s.rendererFailures_,
        s.scheduler_.lastTickMs()
    };
}

OverlayError OverlayEngine::getLastError() const noexcept {
    return state().lastError;
}

void OverlayEngine::clearError() const noexcept {
    state().lastError = OverlayError::Ok;
}

void OverlayEngine::setError(OverlayError err) const noexcept {
    state().lastError = err;
}
