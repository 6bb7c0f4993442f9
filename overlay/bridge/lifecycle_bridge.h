#pragma once

#include "overlay/bridge/node_snapshot.h"
#include "overlay/bridge/snapshot_extractor.h"
#include "overlay/scene/scene_source.h"
#include "overlay/spatial/quad_tree.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

// Notified when a node starts or stops being tracked. The release
// notification is part of the single teardown routine.
class NodeObserver {
public:
    virtual ~NodeObserver() = default;
    virtual void onNodeTracked(const SceneNode& node) = 0;
    virtual void onNodeReleased(NodeId id) = 0;
};

struct BoundsChange {
    NodeId id;
    AABB oldBounds;
    AABB newBounds;
};

struct DirtyReport {
    std::vector<NodeId> refreshed;
    std::vector<BoundsChange> moved;
    std::vector<NodeId> released;
};

struct VisibleEntry {
    NodeId id;
    LodTier lod;
};

// Value checksums captured around the authoritative write of a UI edit.
struct EditChecksums {
    std::uint64_t beforeWrite;
    std::uint64_t afterWrite;
};

class NodeLifecycleBridge : public SceneListener {
public:
    NodeLifecycleBridge(SceneSource& scene, QuadTree& index);
    ~NodeLifecycleBridge() override;

    NodeLifecycleBridge(const NodeLifecycleBridge&) = delete;
    NodeLifecycleBridge& operator=(const NodeLifecycleBridge&) = delete;

    void addObserver(NodeObserver* observer);
    void removeObserver(NodeObserver* observer);

    // Invoked after every scene event the bridge handled.
    void setEventHook(std::function<void(NodeId)> hook) { eventHook_ = std::move(hook); }

    // Subscribes and adopts the nodes already in the scene.
    void attach();
    // Unsubscribes and releases every tracked node.
    void detach();
    bool isAttached() const noexcept { return subscription_ != invalidSubscriptionId; }

    // SceneListener
    void onNodeAdded(const SceneNode& node) override;
    void onNodeRemoved(const SceneNode& node) override;
    void onNodeSelected(const SceneNode& node, bool selected) override;
    void onNodeExecuting(const SceneNode& node, bool executing) override;

    // Re-extracts the node when its fingerprint moved. Returns true if refreshed.
    bool detectDirty(const SceneNode& node, DirtyReport& report);
    // Runs detectDirty over every tracked node; nodes gone from the scene are released.
    DirtyReport detectDirty();

    void applyIndexUpdates(const DirtyReport& report);
    void rebuildIndex();

    // Marks every tracked node culled, then the given entries visible.
    void applyVisibility(const std::vector<VisibleEntry>& visible);

    std::uint64_t liveValueChecksum(NodeId id) const;
    // Replaces the snapshot with `value` at fieldIndex. The cached fingerprint
    // adopts the post-write checksum only if nothing else changed the node.
    bool applyLocalEdit(NodeId id, std::size_t fieldIndex, const FieldValue& value, const EditChecksums& checksums);

    SnapshotPtr snapshot(NodeId id) const;
    const VisibilityState* visibility(NodeId id) const;
    const AABB* trackedBounds(NodeId id) const;
    bool isTracked(NodeId id) const;
    bool isPendingDirty(NodeId id) const;
    std::size_t trackedCount() const noexcept { return nodes_.size(); }
    const std::vector<NodeId>& order() const noexcept { return order_; }

    std::uint32_t extractionErrors() const noexcept { return extractionErrors_; }
    std::uint32_t danglingReleases() const noexcept { return danglingReleases_; }

private:
    struct TrackedNode {
        SnapshotPtr snapshot;
        NodeFingerprint fingerprint;
        AABB bounds;
        VisibilityState visibility;
        std::uint32_t revision;
    };

    void track(const SceneNode& node);
    void refresh(const SceneNode& node, TrackedNode& tracked);
    // The only place a node's derived state is destroyed.
    void release(NodeId id);
    void releaseAll();

    SceneSource& scene_;
    QuadTree& index_;
    SubscriptionId subscription_{invalidSubscriptionId};

    std::unordered_map<NodeId, TrackedNode> nodes_;
    std::vector<NodeId> order_;
    std::unordered_set<NodeId> pendingDirty_;
    std::vector<NodeObserver*> observers_;
    std::function<void(NodeId)> eventHook_;

    std::uint32_t extractionErrors_{0};
    std::uint32_t danglingReleases_{0};
};
