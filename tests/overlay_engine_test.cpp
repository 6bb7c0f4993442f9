#include "tests/overlay_test_common.h"

#include <limits>

using overlay_test::containsId;
using overlay_test::findVisible;
using overlay_test::textField;

TEST(ProtocolInfoTest, NonZeroAndStable) {
    NodeGraph graph;
    ManualFrameClock clock;
    OverlayEngine overlay(graph, clock);
    const auto info1 = overlay.getProtocolInfo();
    const auto info2 = overlay.getProtocolInfo();

    EXPECT_EQ(info1.protocolVersion, OverlayEngine::kProtocolVersion);
    EXPECT_EQ(info1.snapshotVersion, OverlayEngine::kSnapshotVersion);
    EXPECT_EQ(info1.featureFlags, OverlayEngine::kFeatureFlags);
    EXPECT_NE(info1.protocolVersion, 0u);
    EXPECT_NE(info1.snapshotVersion, 0u);
    EXPECT_NE(info1.featureFlags, 0u);
    EXPECT_EQ(info1.featureFlags, info2.featureFlags);
}

TEST_F(OverlayEngineTest, AttachSchedulesFirstFrame) {
    EXPECT_TRUE(overlay->isAttached());
    EXPECT_TRUE(overlay->isFramePending());
    EXPECT_EQ(graph.listenerCount(), 1u);

    frame();
    EXPECT_EQ(overlay->currentFrame()->generation, 1u);
    EXPECT_EQ(renderer.frames.size(), 1u);
    EXPECT_EQ(overlay->currentFrame()->cssTransform, "matrix(1, 0, 0, 1, 0, 0)");
}

TEST_F(OverlayEngineTest, AddedNodeRequestsFrameAndEnters) {
    frame();
    const NodeId id = addNode(10, 10, 100, 80, {textField("prompt", "a")});
    EXPECT_TRUE(overlay->isFramePending());

    frame();
    const auto frameNow = overlay->currentFrame();
    EXPECT_EQ(frameNow->entered, std::vector<NodeId>{id});
    ASSERT_NE(findVisible(*frameNow, id), nullptr);
    EXPECT_TRUE(overlay->visibility(id)->visible);
    EXPECT_TRUE(overlay->visibility(id)->classified);
}

TEST_F(OverlayEngineTest, MovedAwayNodeExits) {
    const NodeId id = addNode(10, 10, 100, 80);
    frame();
    ASSERT_TRUE(containsId(overlay->currentFrame()->entered, id));

    graph.moveNode(id, 50000, 50000);
    overlay->requestFrame();
    frame();
    EXPECT_EQ(overlay->currentFrame()->exited, std::vector<NodeId>{id});
    EXPECT_TRUE(overlay->currentFrame()->nodes.empty());
    EXPECT_TRUE(overlay->visibility(id)->culled);
    EXPECT_FLOAT_EQ(OverlayEngineTestAccessor::index(*overlay).boundsOf(id)->minX, 50000.0f);
}

TEST_F(OverlayEngineTest, ValueChangeIsReportedAsRefresh) {
    const NodeId id = addNode(10, 10, 100, 80, {textField("prompt", "a")});
    frame();

    graph.setFieldValue(id, 0, std::string("b"));
    overlay->requestFrame();
    frame();
    EXPECT_EQ(overlay->currentFrame()->refreshed, std::vector<NodeId>{id});
    EXPECT_EQ(overlay->getStats().refreshedLastTick, 1u);
}

TEST_F(OverlayEngineTest, IdleTickPublishesNothingNew) {
    addNode(10, 10, 100, 80);
    frame();
    const std::uint32_t generation = overlay->currentFrame()->generation;
    const std::size_t published = renderer.frames.size();

    overlay->requestFrame();
    frame();
    EXPECT_EQ(overlay->currentFrame()->generation, generation);
    EXPECT_EQ(renderer.frames.size(), published);
    EXPECT_EQ(overlay->getStats().ticks, 2u);
}

TEST_F(OverlayEngineTest, FrameFollowsEngineOrder) {
    const NodeId a = addNode(300, 10, 50, 50);
    const NodeId b = addNode(10, 10, 50, 50);
    const NodeId c = addNode(150, 10, 50, 50);
    frame();

    const auto& nodes = overlay->currentFrame()->nodes;
    ASSERT_EQ(nodes.size(), 3u);
    EXPECT_EQ(nodes[0].snapshot->id, a);
    EXPECT_EQ(nodes[1].snapshot->id, b);
    EXPECT_EQ(nodes[2].snapshot->id, c);
}

TEST_F(OverlayEngineTest, LodTierAndDetailFollowScale) {
    const NodeId id = addNode(10, 10, 100, 80);
    panTo(0.5f, 0.0f, 0.0f);

    const auto* visible = findVisible(*overlay->currentFrame(), id);
    ASSERT_NE(visible, nullptr);
    EXPECT_EQ(visible->lod, LodTier::Reduced);
    EXPECT_FALSE(visible->detail.showPreviews);
    EXPECT_TRUE(visible->detail.showFields);
    EXPECT_EQ(overlay->visibility(id)->lod, LodTier::Reduced);

    panTo(0.2f, 0.0f, 0.0f);
    EXPECT_EQ(findVisible(*overlay->currentFrame(), id)->lod, LodTier::Minimal);
}

TEST_F(OverlayEngineTest, InvalidCameraKeepsLastTransform) {
    panTo(2.0f, 10.0f, 10.0f);
    graph.setCamera(Camera{std::numeric_limits<float>::quiet_NaN(), 0.0f, 0.0f});
    overlay->requestFrame();
    frame();

    EXPECT_EQ(overlay->getLastError(), OverlayError::InvalidTransform);
    EXPECT_FLOAT_EQ(overlay->currentFrame()->transform.scale, 2.0f);
    EXPECT_EQ(overlay->getStats().transformWarnings, 1u);
    overlay->clearError();
    EXPECT_EQ(overlay->getLastError(), OverlayError::Ok);
}

TEST_F(OverlayEngineTest, InvalidConfigIsClampedAndRecorded) {
    OverlayConfig config;
    config.maxDepth = 0;
    config.viewportWidth = -1.0f;
    overlay->setConfig(config);
    EXPECT_EQ(overlay->getLastError(), OverlayError::InvalidConfig);
    EXPECT_EQ(overlay->config().maxDepth, 1u);
    EXPECT_FLOAT_EQ(overlay->config().viewportWidth, defaultViewportWidth);
    EXPECT_EQ(OverlayEngineTestAccessor::index(*overlay).options().maxDepth, 1u);
}

TEST_F(OverlayEngineTest, ConstructorRecordsInvalidConfig) {
    OverlayConfig config;
    config.leafCapacity = 0;
    OverlayEngine other(graph, clock, config);
    EXPECT_EQ(other.getLastError(), OverlayError::InvalidConfig);
    EXPECT_EQ(other.config().leafCapacity, 1u);
}

TEST_F(OverlayEngineTest, ViewportResizeChangesCulling) {
    const NodeId id = addNode(1500, 10, 50, 50);
    frame();
    EXPECT_EQ(findVisible(*overlay->currentFrame(), id), nullptr);

    overlay->setViewportSize(1600.0f, 900.0f);
    frame();
    EXPECT_NE(findVisible(*overlay->currentFrame(), id), nullptr);
}

TEST_F(OverlayEngineTest, FieldEditErrorsMapToLastError) {
    const NodeId id = addNode(10, 10, 100, 80, {overlay_test::makeField("steps", "number", 20.0)});
    frame();

    EXPECT_EQ(overlay->applyFieldEdit(id, 0, std::string("x")), SyncResult::TypeMismatch);
    EXPECT_EQ(overlay->getLastError(), OverlayError::TypeMismatch);
    EXPECT_EQ(overlay->applyFieldEdit(id, 4, 1.0), SyncResult::FieldMissing);
    EXPECT_EQ(overlay->getLastError(), OverlayError::UnknownField);
    EXPECT_EQ(overlay->applyFieldEdit(77, 0, 1.0), SyncResult::NodeMissing);
    EXPECT_EQ(overlay->getLastError(), OverlayError::UnknownNode);

    EXPECT_EQ(overlay->applyFieldEdit(id, 0, 30.0), SyncResult::Ok);
    EXPECT_TRUE(overlay->isFramePending());
    EXPECT_EQ(overlay->getStats().edits, 1u);
    EXPECT_EQ(overlay->getStats().rejectedEdits, 3u);
}

TEST_F(OverlayEngineTest, RendererFailureDoesNotStopTicks) {
    renderer.throwOnFrame = true;
    addNode(10, 10, 100, 80);
    frame();
    EXPECT_EQ(overlay->getLastError(), OverlayError::CallbackFailed);
    EXPECT_EQ(overlay->getStats().callbackFailures, 1u);
    EXPECT_EQ(overlay->getStats().failedTicks, 0u);

    renderer.throwOnFrame = false;
    addNode(200, 10, 100, 80);
    frame();
    EXPECT_EQ(overlay->currentFrame()->generation, 2u);
}

TEST_F(OverlayEngineTest, ExtractionFailureIsRecordedAndNodeStillRendered) {
    SceneField broken = overlay_test::makeField("seed", "number", std::string("nope"));
    const NodeId id = addNode(10, 10, 100, 80, {broken});
    frame();

    EXPECT_EQ(overlay->getLastError(), OverlayError::ExtractionFailed);
    EXPECT_EQ(overlay->getStats().extractionErrors, 1u);
    const auto* visible = findVisible(*overlay->currentFrame(), id);
    ASSERT_NE(visible, nullptr);
    EXPECT_TRUE(visible->snapshot->fields[0].fallback);
}

TEST_F(OverlayEngineTest, VanishedNodeIsReportedAsInconsistency) {
    addNode(10, 10, 100, 80);
    frame();
    graph.clear();
    overlay->requestFrame();
    frame();
    EXPECT_EQ(overlay->getLastError(), OverlayError::IndexInconsistent);
    EXPECT_EQ(overlay->getStats().trackedNodes, 0u);
    EXPECT_EQ(OverlayEngineTestAccessor::publishedCount(*overlay), 0u);
}

TEST_F(OverlayEngineTest, TeardownLeavesNothingBehind) {
    const NodeId id = addNode(10, 10, 100, 80, {textField("prompt", "a")});
    frame();
    const FieldChangeHandler handler = overlay->fieldChangeHandler(id, 0);
    overlay->setContinuous(true);
    ASSERT_TRUE(clock.hasPending());

    overlay->teardown();
    EXPECT_FALSE(overlay->isAttached());
    EXPECT_EQ(graph.listenerCount(), 0u);
    EXPECT_FALSE(clock.hasPending());
    EXPECT_FALSE(overlay->isFramePending());
    EXPECT_EQ(OverlayEngineTestAccessor::bridge(*overlay).trackedCount(), 0u);
    EXPECT_EQ(OverlayEngineTestAccessor::index(*overlay).size(), 0u);
    EXPECT_EQ(OverlayEngineTestAccessor::sync(*overlay).bindingCount(), 0u);
    EXPECT_EQ(OverlayEngineTestAccessor::publishedCount(*overlay), 0u);
    EXPECT_TRUE(overlay->currentFrame()->nodes.empty());
    EXPECT_EQ(overlay->snapshot(id), nullptr);

    EXPECT_EQ(handler(std::string("late")), SyncResult::NodeMissing);
    EXPECT_EQ(graph.fieldWriteCount(), 0u);

    // Scene events after teardown are not observed.
    addNode(0, 0, 10, 10);
    EXPECT_FALSE(clock.hasPending());
}

TEST_F(OverlayEngineTest, ReattachAdoptsCurrentScene) {
    addNode(10, 10, 100, 80);
    frame();
    overlay->teardown();
    addNode(200, 10, 100, 80);

    overlay->attach();
    frame();
    EXPECT_EQ(overlay->currentFrame()->nodes.size(), 2u);
    EXPECT_EQ(overlay->getStats().trackedNodes, 2u);
}

TEST_F(OverlayEngineTest, StatsReflectTrackedAndCulled) {
    addNode(10, 10, 100, 80);
    addNode(90000, 10, 100, 80);
    frame();

    const auto stats = overlay->getStats();
    EXPECT_EQ(stats.trackedNodes, 2u);
    EXPECT_EQ(stats.visibleNodes, 1u);
    EXPECT_EQ(stats.culledNodes, 1u);
    EXPECT_EQ(stats.frameGeneration, overlay->currentFrame()->generation);
}

TEST_F(OverlayEngineTest, TickNowRunsSynchronously) {
    const NodeId id = addNode(10, 10, 100, 80);
    overlay->tickNow(1.0);
    EXPECT_FALSE(clock.hasPending());
    EXPECT_NE(findVisible(*overlay->currentFrame(), id), nullptr);
}

TEST_F(OverlayEngineTest, ContinuousModeTicksEveryFrame) {
    frame();
    overlay->setContinuous(true);
    frame();
    frame();
    const FrameScheduler& scheduler = OverlayEngineTestAccessor::scheduler(*overlay);
    EXPECT_TRUE(scheduler.isContinuous());
    EXPECT_EQ(scheduler.tickCount(), 3u);
    EXPECT_TRUE(clock.hasPending());

    panTo(1.5f, 0.0f, 0.0f);
    EXPECT_EQ(OverlayEngineTestAccessor::mirror(*overlay).generation(), 1u);
    EXPECT_EQ(overlay->currentFrame()->cssTransform, "matrix(1.5, 0, 0, 1.5, 0, 0)");

    overlay->setContinuous(false);
    frame();
    EXPECT_FALSE(clock.hasPending());
}

TEST_F(OverlayEngineTest, NonStandardAccessorExceptionNeitherEscapesNorStallsTicks) {
    bool failing = true;
    SceneField seed = overlay_test::makeField("seed", "number", 1.0);
    seed.accessor = [&failing]() -> FieldValue {
        if (failing) throw 42;
        return 7.0;
    };

    NodeId id = invalidNodeId;
    EXPECT_NO_THROW(id = addNode(10, 10, 100, 80, {seed}));
    frame();
    EXPECT_EQ(overlay->getStats().ticks, 1u);
    EXPECT_EQ(overlay->getStats().failedTicks, 0u);
    EXPECT_EQ(overlay->getLastError(), OverlayError::ExtractionFailed);
    ASSERT_NE(overlay->snapshot(id), nullptr);
    EXPECT_TRUE(overlay->snapshot(id)->fields[0].fallback);

    failing = false;
    overlay->requestFrame();
    frame();
    overlay->requestFrame();
    frame();
    EXPECT_EQ(overlay->getStats().ticks, 3u);
    EXPECT_FALSE(overlay->snapshot(id)->fields[0].fallback);
    EXPECT_EQ(std::get<double>(overlay->snapshot(id)->fields[0].value), 7.0);
}

TEST_F(OverlayEngineTest, NonStandardRendererExceptionIsContained) {
    class IntThrowingRenderer : public OverlayRenderer {
    public:
        void onFrame(const overlay::protocol::FramePtr&) override { throw 42; }
    } throwing;
    overlay->setRenderer(&throwing);

    addNode(10, 10, 100, 80);
    frame();
    EXPECT_EQ(overlay->getLastError(), OverlayError::CallbackFailed);
    EXPECT_EQ(overlay->getStats().callbackFailures, 1u);

    overlay->setRenderer(&renderer);
    addNode(200, 10, 100, 80);
    frame();
    EXPECT_EQ(overlay->getStats().ticks, 2u);
    EXPECT_EQ(overlay->currentFrame()->generation, 2u);
}
