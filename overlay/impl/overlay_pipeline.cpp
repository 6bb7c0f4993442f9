// Per-tick phases of the overlay, run by FrameScheduler in declaration order.

#include "overlay/overlay_engine.h"
#include "overlay/core/logging.h"
#include "overlay/internal/overlay_state.h"

#include <algorithm>
#include <exception>
#include <memory>

using overlay::protocol::OverlayFrame;
using overlay::protocol::VisibleNode;

void OverlayState::mirrorTransform() {
    transformChanged_ = mirror_.update(scene_.camera());
    if (mirror_.warningCount() != seenWarnings_) {
        seenWarnings_ = mirror_.warningCount();
        lastError = OverlayError::InvalidTransform;
    }
}

void OverlayState::detectDirty() {
    const std::uint32_t dangling = bridge_.danglingReleases();
    dirty_ = bridge_.detectDirty();
    if (bridge_.danglingReleases() != dangling) {
        lastError = OverlayError::IndexInconsistent;
    }
    if (bridge_.extractionErrors() != seenExtractionErrors_) {
        seenExtractionErrors_ = bridge_.extractionErrors();
        lastError = OverlayError::ExtractionFailed;
    }
}

void OverlayState::updateIndex() {
    bridge_.applyIndexUpdates(dirty_);
    const QuadTreeStats stats = index_.getStats();
    if (stats.rebuildCount != seenRebuilds_) {
        seenRebuilds_ = stats.rebuildCount;
        OVERLAY_LOG_DEBUG("index rebuilt: %u entries, depth %u", stats.entryCount, stats.deepestLevel);
    }
}

void OverlayState::recomputeVisibility() {
    selector_.compute(mirror_.current(), index_, visibility_);
    bridge_.applyVisibility(visibility_.visible);
}

void OverlayState::publish() {
    refreshedLastTick_ = static_cast<std::uint32_t>(dirty_.refreshed.size());

    std::unordered_map<NodeId, LodTier> visibleLod;
    visibleLod.reserve(visibility_.visible.size());
    for (const VisibleEntry& entry : visibility_.visible) {
        visibleLod.emplace(entry.id, entry.lod);
    }

    auto frame = std::make_shared<OverlayFrame>();
    frame->transform = mirror_.current();
    frame->cssTransform = mirror_.toCssTransform();
    frame->nodes.reserve(visibleLod.size());

    std::unordered_map<NodeId, SnapshotPtr> next;
    next.reserve(visibleLod.size());
    for (const NodeId id : bridge_.order()) {
        const auto lod = visibleLod.find(id);
        if (lod == visibleLod.end()) continue;
        SnapshotPtr snap = bridge_.snapshot(id);
        if (!snap) continue;

        const auto prev = published_.find(id);
        if (prev == published_.end()) {
            frame->entered.push_back(id);
        } else if (prev->second != snap) {
            frame->refreshed.push_back(id);
        }
        frame->nodes.push_back(VisibleNode{
            snap,
            lod->second,
            detailForTier(lod->second),
            mirror_.sceneToOverlay(snapshotBounds(*snap))
        });
        next.emplace(id, std::move(snap));
    }
    for (const auto& kv : published_) {
        if (next.find(kv.first) == next.end()) frame->exited.push_back(kv.first);
    }
    std::sort(frame->exited.begin(), frame->exited.end());
    published_.swap(next);

    const bool changed = forcePublish_ || transformChanged_
        || !frame->entered.empty() || !frame->exited.empty() || !frame->refreshed.empty();
    if (!changed) return;

    forcePublish_ = false;
    frame->generation = frame_->generation + 1;
    frame_ = std::move(frame);

    if (!renderer_) return;
    try {
        renderer_->onFrame(frame_);
    } catch (const std::exception& e) {
        OVERLAY_LOG_WARN("renderer rejected frame %u: %s", frame_->generation, e.what());
        rendererFailures_++;
        lastError = OverlayError::CallbackFailed;
    } catch (...) {
        OVERLAY_LOG_WARN("renderer rejected frame %u", frame_->generation);
        rendererFailures_++;
        lastError = OverlayError::CallbackFailed;
    }
}
