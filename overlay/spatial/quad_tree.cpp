#include "overlay/spatial/quad_tree.h"
#include "overlay/core/logging.h"
#include "overlay/core/util.h"

#include <algorithm>
#include <cmath>

namespace {
    AABB defaultRoot(float halfExtent) {
        return AABB{-halfExtent, -halfExtent, halfExtent, halfExtent};
    }

    bool isFiniteBounds(const AABB& b) {
        return isFiniteF32(b.minX) && isFiniteF32(b.minY) && isFiniteF32(b.maxX) && isFiniteF32(b.maxY);
    }
}

QuadTree::QuadTree(const QuadTreeOptions& options) : options_(options) {
    resetRoot(defaultRoot(options_.rootHalfExtent));
}

void QuadTree::setOptions(const QuadTreeOptions& options) {
    options_ = options;
    std::vector<SpatialIndexEntry> entries;
    entries.reserve(slots_.size());
    for (const auto& kv : slots_) {
        entries.push_back(SpatialIndexEntry{kv.first, kv.second.bounds});
    }
    rebuild(entries);
}

void QuadTree::clear() {
    resetRoot(defaultRoot(options_.rootHalfExtent));
    staleness_ = 0;
}

void QuadTree::resetRoot(const AABB& bounds) {
    nodes_.clear();
    nodes_.push_back(QuadNode{bounds, kNoChildren, 0, {}});
    overflow_.clear();
    slots_.clear();
    deepestLevel_ = 0;
}

void QuadTree::eraseItem(std::vector<SpatialIndexEntry>& items, NodeId id) {
    // Swap-remove
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (items[i].nodeId == id) {
            items[i] = items.back();
            items.pop_back();
            return;
        }
    }
}

std::int32_t QuadTree::childFor(std::int32_t nodeIndex, const AABB& bounds) const {
    const std::int32_t first = nodes_[static_cast<std::size_t>(nodeIndex)].firstChild;
    if (first == kNoChildren) return kNoChildren;
    for (std::int32_t k = 0; k < 4; ++k) {
        if (containsBounds(nodes_[static_cast<std::size_t>(first + k)].bounds, bounds)) {
            return first + k;
        }
    }
    return kNoChildren;
}

void QuadTree::split(std::int32_t nodeIndex) {
    const AABB b = nodes_[static_cast<std::size_t>(nodeIndex)].bounds;
    const std::uint32_t childDepth = nodes_[static_cast<std::size_t>(nodeIndex)].depth + 1;
    const float midX = (b.minX + b.maxX) * 0.5f;
    const float midY = (b.minY + b.maxY) * 0.5f;

    const std::int32_t first = static_cast<std::int32_t>(nodes_.size());
    nodes_.push_back(QuadNode{AABB{b.minX, b.minY, midX, midY}, kNoChildren, childDepth, {}});
    nodes_.push_back(QuadNode{AABB{midX, b.minY, b.maxX, midY}, kNoChildren, childDepth, {}});
    nodes_.push_back(QuadNode{AABB{b.minX, midY, midX, b.maxY}, kNoChildren, childDepth, {}});
    nodes_.push_back(QuadNode{AABB{midX, midY, b.maxX, b.maxY}, kNoChildren, childDepth, {}});
    nodes_[static_cast<std::size_t>(nodeIndex)].firstChild = first;
    deepestLevel_ = std::max(deepestLevel_, childDepth);

    std::vector<SpatialIndexEntry> items;
    items.swap(nodes_[static_cast<std::size_t>(nodeIndex)].items);
    for (const SpatialIndexEntry& item : items) {
        const std::int32_t child = childFor(nodeIndex, item.bounds);
        const std::int32_t target = child == kNoChildren ? nodeIndex : child;
        nodes_[static_cast<std::size_t>(target)].items.push_back(item);
        slots_[item.nodeId].node = target;
    }

    for (std::int32_t k = 0; k < 4; ++k) {
        const std::size_t c = static_cast<std::size_t>(first + k);
        if (nodes_[c].items.size() > options_.leafCapacity && childDepth < options_.maxDepth) {
            split(first + k);
        }
    }
}

std::int32_t QuadTree::placeEntry(NodeId id, const AABB& bounds) {
    if (!containsBounds(nodes_.front().bounds, bounds)) {
        overflow_.push_back(SpatialIndexEntry{id, bounds});
        slots_[id] = Slot{bounds, kOverflowNode};
        staleness_++;
        return kOverflowNode;
    }

    std::int32_t index = 0;
    for (;;) {
        const std::int32_t child = childFor(index, bounds);
        if (child == kNoChildren) break;
        index = child;
    }

    QuadNode& node = nodes_[static_cast<std::size_t>(index)];
    node.items.push_back(SpatialIndexEntry{id, bounds});
    slots_[id] = Slot{bounds, index};

    const bool isLeaf = node.firstChild == kNoChildren;
    if (isLeaf && node.items.size() > options_.leafCapacity && node.depth < options_.maxDepth) {
        split(index);
    }
    return slots_[id].node;
}

void QuadTree::insert(const SpatialIndexEntry& entry) {
    if (contains(entry.nodeId)) {
        remove(entry.nodeId);
    }
    placeEntry(entry.nodeId, entry.bounds);
}

bool QuadTree::remove(NodeId id) {
    const auto it = slots_.find(id);
    if (it == slots_.end()) return false;

    if (it->second.node == kOverflowNode) {
        eraseItem(overflow_, id);
    } else {
        eraseItem(nodes_[static_cast<std::size_t>(it->second.node)].items, id);
    }
    slots_.erase(it);
    staleness_++;
    return true;
}

void QuadTree::update(NodeId id, const AABB& oldBounds, const AABB& newBounds) {
    const auto it = slots_.find(id);
    if (it == slots_.end()) {
        OVERLAY_LOG_WARN("index update for untracked node %u", id);
        markStale();
    } else if (!sameBounds(it->second.bounds, oldBounds)) {
        OVERLAY_LOG_WARN("index bounds for node %u disagree with caller", id);
        markStale();
    }
    remove(id);
    placeEntry(id, newBounds);
}

void QuadTree::query(const AABB& range, std::vector<NodeId>& results) const {
    for (const SpatialIndexEntry& item : overflow_) {
        if (intersects(item.bounds, range)) results.push_back(item.nodeId);
    }

    std::vector<std::int32_t> stack;
    stack.reserve(options_.maxDepth * 4 + 4);
    stack.push_back(0);
    while (!stack.empty()) {
        const std::int32_t index = stack.back();
        stack.pop_back();
        const QuadNode& node = nodes_[static_cast<std::size_t>(index)];
        if (!intersects(node.bounds, range)) continue;

        for (const SpatialIndexEntry& item : node.items) {
            if (intersects(item.bounds, range)) results.push_back(item.nodeId);
        }
        if (node.firstChild != kNoChildren) {
            for (std::int32_t k = 0; k < 4; ++k) stack.push_back(node.firstChild + k);
        }
    }
}

void QuadTree::rebuild(const std::vector<SpatialIndexEntry>& entries) {
    bool any = false;
    AABB extent{0.0f, 0.0f, 0.0f, 0.0f};
    for (const SpatialIndexEntry& e : entries) {
        if (!isFiniteBounds(e.bounds)) continue;
        extent = any ? unionBounds(extent, e.bounds) : e.bounds;
        any = true;
    }

    AABB root = defaultRoot(options_.rootHalfExtent);
    if (any) {
        // Square root so the four quadrants keep equal extent.
        const float cx = (extent.minX + extent.maxX) * 0.5f;
        const float cy = (extent.minY + extent.maxY) * 0.5f;
        const float half = std::max(extent.maxX - extent.minX, extent.maxY - extent.minY) * 0.55f + 1.0f;
        root = AABB{cx - half, cy - half, cx + half, cy + half};
    }

    resetRoot(root);
    for (const SpatialIndexEntry& e : entries) {
        if (slots_.find(e.nodeId) != slots_.end()) remove(e.nodeId);
        placeEntry(e.nodeId, e.bounds);
    }
    staleness_ = 0;
    rebuildCount_++;
    OVERLAY_LOG_DEBUG("quad-tree rebuilt: %zu entries, %zu nodes", slots_.size(), nodes_.size());
}

bool QuadTree::contains(NodeId id) const {
    return slots_.find(id) != slots_.end();
}

const AABB* QuadTree::boundsOf(NodeId id) const {
    const auto it = slots_.find(id);
    return it == slots_.end() ? nullptr : &it->second.bounds;
}

bool QuadTree::needsRebuild() const noexcept {
    return staleness_ >= options_.stalenessThreshold || overflow_.size() > options_.overflowRebuildLimit;
}

QuadTreeStats QuadTree::getStats() const noexcept {
    return QuadTreeStats{
        static_cast<std::uint32_t>(nodes_.size()),
        static_cast<std::uint32_t>(slots_.size()),
        deepestLevel_,
        static_cast<std::uint32_t>(overflow_.size()),
        staleness_,
        rebuildCount_
    };
}
