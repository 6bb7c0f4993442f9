#include "tests/overlay_test_common.h"

#include <unordered_map>

TEST_F(OverlayEngineTest, PanningDoesNotReextractOrRebuild) {
    constexpr int kColumns = 50;
    constexpr int kRows = 40;
    for (int row = 0; row < kRows; ++row) {
        for (int col = 0; col < kColumns; ++col) {
            addNode(col * 150.0f, row * 150.0f, 120.0f, 90.0f, {overlay_test::textField("prompt", "x")});
        }
    }
    frame();
    ASSERT_EQ(overlay->getStats().trackedNodes, static_cast<std::uint32_t>(kColumns * kRows));

    std::unordered_map<NodeId, const NodeSnapshot*> before;
    for (const NodeId id : OverlayEngineTestAccessor::bridge(*overlay).order()) {
        before.emplace(id, overlay->snapshot(id).get());
    }
    const auto rebuildsBefore = overlay->getStats().indexRebuilds;
    const auto generationBefore = overlay->currentFrame()->generation;

    for (int step = 1; step <= 30; ++step) {
        panTo(1.0f, -40.0f * static_cast<float>(step), -25.0f * static_cast<float>(step));
        EXPECT_EQ(overlay->getStats().refreshedLastTick, 0u);
        EXPECT_TRUE(overlay->currentFrame()->refreshed.empty());
    }

    EXPECT_EQ(overlay->getStats().indexRebuilds, rebuildsBefore);
    EXPECT_EQ(overlay->currentFrame()->generation, generationBefore + 30);
    EXPECT_LT(overlay->getStats().visibleNodes, overlay->getStats().trackedNodes);
    for (const auto& kv : before) {
        EXPECT_EQ(overlay->snapshot(kv.first).get(), kv.second);
    }
}

TEST_F(OverlayEngineTest, IdleTicksLeaveStateUntouched) {
    for (int i = 0; i < 500; ++i) {
        addNode((i % 25) * 100.0f, (i / 25) * 100.0f, 80.0f, 60.0f);
    }
    frame();
    const auto generation = overlay->currentFrame()->generation;
    const auto rebuilds = overlay->getStats().indexRebuilds;

    overlay->setContinuous(true);
    for (int i = 0; i < 20; ++i) frame();
    overlay->setContinuous(false);

    EXPECT_EQ(overlay->currentFrame()->generation, generation);
    EXPECT_EQ(overlay->getStats().indexRebuilds, rebuilds);
    EXPECT_EQ(overlay->getStats().refreshedLastTick, 0u);
}
