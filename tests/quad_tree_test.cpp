#include <gtest/gtest.h>
#include "overlay/spatial/quad_tree.h"

#include <algorithm>
#include <map>
#include <random>
#include <vector>

namespace {
std::vector<NodeId> linearScan(const std::map<NodeId, AABB>& entries, const AABB& range) {
    std::vector<NodeId> out;
    for (const auto& kv : entries) {
        if (intersects(kv.second, range)) out.push_back(kv.first);
    }
    return out;
}

std::vector<NodeId> sortedQuery(const QuadTree& tree, const AABB& range) {
    std::vector<NodeId> out;
    tree.query(range, out);
    std::sort(out.begin(), out.end());
    return out;
}
} // namespace

TEST(QuadTreeTest, MatchesLinearScanUnderRandomEdits) {
    std::mt19937 rng(1234);
    std::uniform_real_distribution<float> pos(-6000.0f, 6000.0f);
    std::uniform_real_distribution<float> size(0.0f, 300.0f);
    std::uniform_real_distribution<float> far(9000.0f, 20000.0f);

    QuadTreeOptions options;
    options.leafCapacity = 4;
    QuadTree tree(options);
    std::map<NodeId, AABB> reference;

    for (NodeId id = 1; id <= 600; ++id) {
        // Every 50th entry lies outside the root.
        const float x = (id % 50 == 0) ? far(rng) : pos(rng);
        const AABB b = makeBounds(x, pos(rng), size(rng), size(rng));
        tree.insert(SpatialIndexEntry{id, b});
        reference[id] = b;
    }

    for (int i = 0; i < 150; ++i) {
        const NodeId id = 1 + static_cast<NodeId>(rng() % 600);
        EXPECT_EQ(tree.remove(id), reference.erase(id) == 1);
    }

    for (int i = 0; i < 300; ++i) {
        const NodeId id = 1 + static_cast<NodeId>(rng() % 600);
        const auto it = reference.find(id);
        if (it == reference.end()) continue;
        const AABB moved = makeBounds(pos(rng), pos(rng), size(rng), size(rng));
        tree.update(id, it->second, moved);
        it->second = moved;
    }

    EXPECT_EQ(tree.size(), reference.size());
    for (int i = 0; i < 80; ++i) {
        const AABB range = makeBounds(pos(rng), pos(rng), size(rng) * 10.0f, size(rng) * 10.0f);
        EXPECT_EQ(sortedQuery(tree, range), linearScan(reference, range));
    }
    const AABB everything{-30000.0f, -30000.0f, 30000.0f, 30000.0f};
    EXPECT_EQ(sortedQuery(tree, everything).size(), reference.size());
}

TEST(QuadTreeTest, InsertingExistingIdMovesIt) {
    QuadTree tree;
    tree.insert(SpatialIndexEntry{7, makeBounds(0, 0, 10, 10)});
    tree.insert(SpatialIndexEntry{7, makeBounds(500, 500, 10, 10)});
    EXPECT_EQ(tree.size(), 1u);
    EXPECT_TRUE(sortedQuery(tree, makeBounds(0, 0, 20, 20)).empty());
    EXPECT_EQ(sortedQuery(tree, makeBounds(495, 495, 20, 20)), std::vector<NodeId>{7});
}

TEST(QuadTreeTest, RemoveUnknownIdReturnsFalse) {
    QuadTree tree;
    EXPECT_FALSE(tree.remove(42));
    tree.insert(SpatialIndexEntry{42, makeBounds(0, 0, 1, 1)});
    EXPECT_TRUE(tree.remove(42));
    EXPECT_FALSE(tree.contains(42));
    EXPECT_EQ(tree.boundsOf(42), nullptr);
}

TEST(QuadTreeTest, ZeroSizedEntriesAreFoundByTouchingQueries) {
    QuadTree tree;
    tree.insert(SpatialIndexEntry{1, makeBounds(100, 100, 0, 0)});
    EXPECT_EQ(sortedQuery(tree, makeBounds(90, 90, 10, 10)), std::vector<NodeId>{1});
}

TEST(QuadTreeTest, SplitsFullLeaves) {
    QuadTreeOptions options;
    options.leafCapacity = 2;
    QuadTree tree(options);
    NodeId id = 1;
    for (int i = 0; i < 4; ++i) {
        for (int j = 0; j < 4; ++j) {
            tree.insert(SpatialIndexEntry{id++, makeBounds(-7000.0f + i * 3500.0f, -7000.0f + j * 3500.0f, 10, 10)});
        }
    }
    const QuadTreeStats stats = tree.getStats();
    EXPECT_GT(stats.deepestLevel, 0u);
    EXPECT_GT(stats.nodeCount, 1u);
    EXPECT_EQ(stats.entryCount, 16u);
}

TEST(QuadTreeTest, RespectsMaxDepth) {
    QuadTreeOptions options;
    options.leafCapacity = 1;
    options.maxDepth = 3;
    QuadTree tree(options);
    for (NodeId id = 1; id <= 50; ++id) {
        tree.insert(SpatialIndexEntry{id, makeBounds(1.0f + id * 0.01f, 1.0f, 0.001f, 0.001f)});
    }
    EXPECT_LE(tree.getStats().deepestLevel, 3u);
    EXPECT_EQ(sortedQuery(tree, makeBounds(0, 0, 5, 5)).size(), 50u);
}

TEST(QuadTreeTest, MismatchedUpdateMarksIndexStale) {
    QuadTree tree;
    tree.insert(SpatialIndexEntry{1, makeBounds(0, 0, 10, 10)});
    EXPECT_FALSE(tree.needsRebuild());

    tree.update(1, makeBounds(50, 50, 10, 10), makeBounds(200, 200, 10, 10));
    EXPECT_TRUE(tree.needsRebuild());
    EXPECT_EQ(sortedQuery(tree, makeBounds(195, 195, 20, 20)), std::vector<NodeId>{1});

    tree.rebuild({SpatialIndexEntry{1, makeBounds(200, 200, 10, 10)}});
    EXPECT_FALSE(tree.needsRebuild());
    EXPECT_EQ(tree.getStats().rebuildCount, 1u);
    EXPECT_EQ(tree.getStats().staleness, 0u);
}

TEST(QuadTreeTest, OverflowBeyondLimitRequestsRebuild) {
    QuadTreeOptions options;
    options.rootHalfExtent = 100.0f;
    options.overflowRebuildLimit = 2;
    QuadTree tree(options);

    std::vector<SpatialIndexEntry> entries;
    for (NodeId id = 1; id <= 3; ++id) {
        entries.push_back(SpatialIndexEntry{id, makeBounds(1000.0f * id, 0, 10, 10)});
        tree.insert(entries.back());
    }
    EXPECT_EQ(tree.getStats().overflowCount, 3u);
    EXPECT_TRUE(tree.needsRebuild());
    EXPECT_EQ(sortedQuery(tree, makeBounds(1995, -5, 20, 20)), std::vector<NodeId>{2});

    tree.rebuild(entries);
    EXPECT_EQ(tree.getStats().overflowCount, 0u);
    EXPECT_FALSE(tree.needsRebuild());
    EXPECT_TRUE(containsBounds(tree.rootBounds(), makeBounds(1000, 0, 2010, 10)));
    EXPECT_EQ(sortedQuery(tree, makeBounds(1995, -5, 20, 20)), std::vector<NodeId>{2});
}

TEST(QuadTreeTest, SetOptionsKeepsEntries) {
    QuadTree tree;
    tree.insert(SpatialIndexEntry{1, makeBounds(0, 0, 10, 10)});
    tree.insert(SpatialIndexEntry{2, makeBounds(100, 100, 10, 10)});

    QuadTreeOptions options;
    options.leafCapacity = 1;
    tree.setOptions(options);
    EXPECT_EQ(tree.size(), 2u);
    EXPECT_EQ(sortedQuery(tree, makeBounds(-10, -10, 200, 200)), (std::vector<NodeId>{1, 2}));
}
