#pragma once

#include "overlay/scene/scene_source.h"

#include <cstdint>
#include <memory>
#include <unordered_map>
#include <utility>
#include <vector>

// In-memory authoritative scene. Used by native hosts, the wasm module and
// tests; it models a non-reactive engine: geometry and value mutations raise
// no events, only add/remove/select/execute do.
class NodeGraph : public SceneSource {
public:
    NodeGraph() = default;
    NodeGraph(const NodeGraph&) = delete;
    NodeGraph& operator=(const NodeGraph&) = delete;

    void clear() noexcept;

    // Assigns an id when node.id is invalidNodeId. Replaces nothing: an existing id is rejected.
    NodeId addNode(SceneNode node);
    bool removeNode(NodeId id);

    bool moveNode(NodeId id, float x, float y);
    bool resizeNode(NodeId id, float w, float h);
    bool setTitle(NodeId id, const std::string& title);
    bool setSelected(NodeId id, bool selected);
    bool setExecuting(NodeId id, bool executing);

    // Programmatic edit (history replay, scripts, remote sync). Raises nothing.
    bool setFieldValue(NodeId id, std::size_t fieldIndex, const FieldValue& value);

    void setCamera(const Camera& camera) { camera_ = camera; }

    SceneNode* mutableNode(NodeId id);
    std::size_t nodeCount() const noexcept { return order_.size(); }
    std::size_t listenerCount() const noexcept { return listeners_.size(); }
    std::uint32_t fieldWriteCount() const noexcept { return fieldWriteCount_; }

    // SceneSource
    Camera camera() const override { return camera_; }
    const SceneNode* findNode(NodeId id) const override;
    void forEachNode(const std::function<void(const SceneNode&)>& fn) const override;
    bool writeFieldValue(NodeId id, std::size_t fieldIndex, const FieldValue& value) override;
    SubscriptionId subscribe(SceneListener* listener) override;
    void unsubscribe(SubscriptionId id) override;

private:
    template <typename Fn>
    void notify(Fn&& fn);

    std::unordered_map<NodeId, std::unique_ptr<SceneNode>> nodes_;
    std::vector<NodeId> order_;
    std::vector<std::pair<SubscriptionId, SceneListener*>> listeners_;
    Camera camera_{};
    NodeId nextNodeId_{1};
    SubscriptionId nextSubscriptionId_{1};
    std::uint32_t fieldWriteCount_{0};
};
