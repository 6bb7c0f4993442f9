#include "overlay/bridge/lifecycle_bridge.h"
#include "overlay/core/logging.h"

#include <algorithm>
#include <exception>
#include <memory>

NodeLifecycleBridge::NodeLifecycleBridge(SceneSource& scene, QuadTree& index)
    : scene_(scene), index_(index) {}

NodeLifecycleBridge::~NodeLifecycleBridge() {
    detach();
}

void NodeLifecycleBridge::addObserver(NodeObserver* observer) {
    if (!observer) return;
    if (std::find(observers_.begin(), observers_.end(), observer) != observers_.end()) return;
    observers_.push_back(observer);
}

void NodeLifecycleBridge::removeObserver(NodeObserver* observer) {
    observers_.erase(std::remove(observers_.begin(), observers_.end(), observer), observers_.end());
}

void NodeLifecycleBridge::attach() {
    if (isAttached()) return;
    subscription_ = scene_.subscribe(this);
    scene_.forEachNode([this](const SceneNode& node) { track(node); });
    OVERLAY_LOG_DEBUG("bridge attached, %zu nodes adopted", nodes_.size());
}

void NodeLifecycleBridge::detach() {
    if (isAttached()) {
        scene_.unsubscribe(subscription_);
        subscription_ = invalidSubscriptionId;
    }
    releaseAll();
    index_.clear();
}

void NodeLifecycleBridge::onNodeAdded(const SceneNode& node) {
    track(node);
    if (eventHook_) eventHook_(node.id);
}

void NodeLifecycleBridge::onNodeRemoved(const SceneNode& node) {
    release(node.id);
    if (eventHook_) eventHook_(node.id);
}

void NodeLifecycleBridge::onNodeSelected(const SceneNode& node, bool) {
    if (!isTracked(node.id)) return;
    pendingDirty_.insert(node.id);
    if (eventHook_) eventHook_(node.id);
}

void NodeLifecycleBridge::onNodeExecuting(const SceneNode& node, bool) {
    if (!isTracked(node.id)) return;
    pendingDirty_.insert(node.id);
    if (eventHook_) eventHook_(node.id);
}

void NodeLifecycleBridge::track(const SceneNode& node) {
    if (isTracked(node.id)) {
        // Id reused by a new node (e.g. a reloaded scene): drop everything
        // derived from the old one before adopting it.
        OVERLAY_LOG_DEBUG("node %u added while tracked; re-tracking", node.id);
        release(node.id);
    }

    ExtractionReport extraction;
    TrackedNode tracked{};
    tracked.revision = 1;
    tracked.snapshot = std::make_shared<const NodeSnapshot>(extractSnapshot(node, tracked.revision, extraction));
    tracked.fingerprint = computeFingerprint(node);
    tracked.bounds = nodeBounds(node);
    tracked.visibility = VisibilityState{};
    extractionErrors_ += extraction.fallbackFields;

    const NodeId id = node.id;
    const AABB bounds = tracked.bounds;
    nodes_.emplace(id, std::move(tracked));
    order_.push_back(id);
    index_.insert(SpatialIndexEntry{id, bounds});

    for (NodeObserver* observer : observers_) observer->onNodeTracked(node);
}

void NodeLifecycleBridge::refresh(const SceneNode& node, TrackedNode& tracked) {
    ExtractionReport extraction;
    tracked.revision++;
    tracked.snapshot = std::make_shared<const NodeSnapshot>(extractSnapshot(node, tracked.revision, extraction));
    tracked.fingerprint = computeFingerprint(node);
    extractionErrors_ += extraction.fallbackFields;
}

void NodeLifecycleBridge::release(NodeId id) {
    nodes_.erase(id);
    order_.erase(std::remove(order_.begin(), order_.end(), id), order_.end());
    pendingDirty_.erase(id);
    index_.remove(id);
    for (NodeObserver* observer : observers_) observer->onNodeReleased(id);
}

void NodeLifecycleBridge::releaseAll() {
    const std::vector<NodeId> ids = order_;
    for (const NodeId id : ids) release(id);
    // Anything not reachable through order_ is an inconsistency; drop it too.
    while (!nodes_.empty()) release(nodes_.begin()->first);
    pendingDirty_.clear();
}

bool NodeLifecycleBridge::detectDirty(const SceneNode& node, DirtyReport& report) {
    const auto it = nodes_.find(node.id);
    if (it == nodes_.end()) return false;
    TrackedNode& tracked = it->second;

    const NodeFingerprint fp = computeFingerprint(node);
    const bool forced = pendingDirty_.erase(node.id) > 0;
    if (!forced && fp == tracked.fingerprint) return false;

    const AABB bounds = nodeBounds(node);
    if (!sameBounds(bounds, tracked.bounds)) {
        report.moved.push_back(BoundsChange{node.id, tracked.bounds, bounds});
        tracked.bounds = bounds;
    }

    refresh(node, tracked);
    report.refreshed.push_back(node.id);
    return true;
}

DirtyReport NodeLifecycleBridge::detectDirty() {
    DirtyReport report;
    const std::vector<NodeId> ids = order_;
    for (const NodeId id : ids) {
        const SceneNode* node = scene_.findNode(id);
        if (!node) {
            OVERLAY_LOG_WARN("node %u vanished without a removal event; releasing", id);
            danglingReleases_++;
            release(id);
            report.released.push_back(id);
            continue;
        }
        try {
            detectDirty(*node, report);
        } catch (const std::exception& e) {
            // One node's failure must not stop the pass.
            OVERLAY_LOG_WARN("dirty detection failed for node %u: %s", id, e.what());
            extractionErrors_++;
        } catch (...) {
            OVERLAY_LOG_WARN("dirty detection failed for node %u", id);
            extractionErrors_++;
        }
    }
    return report;
}

void NodeLifecycleBridge::applyIndexUpdates(const DirtyReport& report) {
    for (const BoundsChange& change : report.moved) {
        if (!isTracked(change.id)) continue;
        index_.update(change.id, change.oldBounds, change.newBounds);
    }
    if (index_.needsRebuild()) {
        rebuildIndex();
    }
}

void NodeLifecycleBridge::rebuildIndex() {
    std::vector<SpatialIndexEntry> entries;
    entries.reserve(order_.size());
    for (const NodeId id : order_) {
        auto it = nodes_.find(id);
        if (it == nodes_.end()) continue;
        const SceneNode* node = scene_.findNode(id);
        if (node) it->second.bounds = nodeBounds(*node);
        entries.push_back(SpatialIndexEntry{id, it->second.bounds});
    }
    index_.rebuild(entries);
}

void NodeLifecycleBridge::applyVisibility(const std::vector<VisibleEntry>& visible) {
    for (auto& kv : nodes_) {
        VisibilityState& state = kv.second.visibility;
        state.visible = false;
        state.culled = true;
        state.classified = true;
    }
    for (const VisibleEntry& entry : visible) {
        const auto it = nodes_.find(entry.id);
        if (it == nodes_.end()) continue;
        VisibilityState& state = it->second.visibility;
        state.visible = true;
        state.culled = false;
        state.lod = entry.lod;
    }
}

std::uint64_t NodeLifecycleBridge::liveValueChecksum(NodeId id) const {
    const SceneNode* node = scene_.findNode(id);
    if (!node) return 0;
    return computeFingerprint(*node).valueChecksum;
}

bool NodeLifecycleBridge::applyLocalEdit(NodeId id, std::size_t fieldIndex, const FieldValue& value, const EditChecksums& checksums) {
    const auto it = nodes_.find(id);
    if (it == nodes_.end()) return false;
    TrackedNode& tracked = it->second;
    if (!tracked.snapshot || fieldIndex >= tracked.snapshot->fields.size()) return false;

    auto next = std::make_shared<NodeSnapshot>(*tracked.snapshot);
    FieldSnapshot& field = next->fields[fieldIndex];
    field.value = value;
    field.fallback = false;
    tracked.revision++;
    next->revision = tracked.revision;
    tracked.snapshot = std::move(next);

    // Adopt the edit into the fingerprint only when the write was the sole
    // value change; otherwise the next pass re-extracts.
    if (tracked.fingerprint.valueChecksum == checksums.beforeWrite
        && liveValueChecksum(id) == checksums.afterWrite) {
        tracked.fingerprint.valueChecksum = checksums.afterWrite;
    }
    return true;
}

SnapshotPtr NodeLifecycleBridge::snapshot(NodeId id) const {
    const auto it = nodes_.find(id);
    return it == nodes_.end() ? SnapshotPtr{} : it->second.snapshot;
}

const VisibilityState* NodeLifecycleBridge::visibility(NodeId id) const {
    const auto it = nodes_.find(id);
    return it == nodes_.end() ? nullptr : &it->second.visibility;
}

const AABB* NodeLifecycleBridge::trackedBounds(NodeId id) const {
    const auto it = nodes_.find(id);
    return it == nodes_.end() ? nullptr : &it->second.bounds;
}

bool NodeLifecycleBridge::isTracked(NodeId id) const {
    return nodes_.find(id) != nodes_.end();
}

bool NodeLifecycleBridge::isPendingDirty(NodeId id) const {
    return pendingDirty_.find(id) != pendingDirty_.end();
}
