#pragma once

#include "overlay/core/types.h"

#include <cstdint>
#include <unordered_map>
#include <vector>

struct SpatialIndexEntry {
    NodeId nodeId;
    AABB bounds;
};

struct QuadTreeOptions {
    std::uint32_t maxDepth{defaultIndexMaxDepth};
    std::uint32_t leafCapacity{defaultIndexLeafCapacity};
    std::uint32_t stalenessThreshold{defaultIndexStalenessThreshold};
    std::uint32_t overflowRebuildLimit{defaultIndexOverflowRebuildLimit};
    float rootHalfExtent{defaultIndexRootHalfExtent};
};

struct QuadTreeStats {
    std::uint32_t nodeCount;
    std::uint32_t entryCount;
    std::uint32_t deepestLevel;
    std::uint32_t overflowCount;
    std::uint32_t staleness;
    std::uint32_t rebuildCount;
};

// Region quad-tree over scene-space bounds. Entries live in the deepest node
// that fully contains them; entries outside the root live in an overflow list.
class QuadTree {
public:
    explicit QuadTree(const QuadTreeOptions& options = QuadTreeOptions{});

    void setOptions(const QuadTreeOptions& options);
    const QuadTreeOptions& options() const noexcept { return options_; }

    void clear();

    // Inserting an id that is already present moves it.
    void insert(const SpatialIndexEntry& entry);
    bool remove(NodeId id);
    // remove + insert. A mismatching oldBounds marks the index stale.
    void update(NodeId id, const AABB& oldBounds, const AABB& newBounds);

    // Appends every id whose bounds intersect `range`.
    void query(const AABB& range, std::vector<NodeId>& results) const;

    // Replaces the whole tree, refitting the root to the entries.
    void rebuild(const std::vector<SpatialIndexEntry>& entries);

    bool contains(NodeId id) const;
    const AABB* boundsOf(NodeId id) const;
    std::size_t size() const noexcept { return slots_.size(); }
    const AABB& rootBounds() const noexcept { return nodes_.front().bounds; }

    bool needsRebuild() const noexcept;
    void markStale() noexcept { staleness_ = options_.stalenessThreshold; }
    QuadTreeStats getStats() const noexcept;

private:
    static constexpr std::int32_t kOverflowNode = -1;
    static constexpr std::int32_t kNoChildren = -1;

    struct QuadNode {
        AABB bounds;
        std::int32_t firstChild;   // index of 4 consecutive children, or kNoChildren
        std::uint32_t depth;
        std::vector<SpatialIndexEntry> items;
    };

    struct Slot {
        AABB bounds;
        std::int32_t node;         // owning QuadNode index, or kOverflowNode
    };

    void resetRoot(const AABB& bounds);
    std::int32_t placeEntry(NodeId id, const AABB& bounds);
    void split(std::int32_t nodeIndex);
    std::int32_t childFor(std::int32_t nodeIndex, const AABB& bounds) const;
    static void eraseItem(std::vector<SpatialIndexEntry>& items, NodeId id);

    QuadTreeOptions options_;
    std::vector<QuadNode> nodes_;
    std::vector<SpatialIndexEntry> overflow_;
    std::unordered_map<NodeId, Slot> slots_;
    std::uint32_t staleness_{0};
    std::uint32_t deepestLevel_{0};
    std::uint32_t rebuildCount_{0};
};
