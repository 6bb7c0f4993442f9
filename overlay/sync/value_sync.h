#pragma once

#include "overlay/bridge/lifecycle_bridge.h"
#include "overlay/field/field_value.h"
#include "overlay/scene/scene_source.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <unordered_map>
#include <vector>

enum class SyncResult : std::uint8_t {
    Ok = 0,
    NodeMissing = 1,
    FieldMissing = 2,
    TypeMismatch = 3,
    CallbackFailed = 4, // edit applied; the engine's own callback threw
};

const char* syncResultName(SyncResult result);

using FieldChangeHandler = std::function<SyncResult(const FieldValue&)>;

// UI -> authority edit path. Every edit writes the engine field first, then
// runs the callback the engine had registered, then updates the snapshot.
class ValueSync : public NodeObserver {
public:
    ValueSync(SceneSource& scene, NodeLifecycleBridge& bridge);
    ~ValueSync() override;

    ValueSync(const ValueSync&) = delete;
    ValueSync& operator=(const ValueSync&) = delete;

    // The handler keeps only ids, the node's binding generation and a weak
    // token. Calling it after clear(), after this object is gone, or after
    // the node was released (even if the id was reused) returns NodeMissing.
    FieldChangeHandler handlerFor(NodeId id, std::size_t fieldIndex) const;

    SyncResult onFieldChange(NodeId id, std::size_t fieldIndex, const FieldValue& value);

    // Called after each applied edit, e.g. to request a frame.
    void setEditListener(std::function<void(NodeId)> listener) { editListener_ = std::move(listener); }

    bool hasBindings(NodeId id) const;
    // 0 when the node is not bound.
    std::uint64_t bindingGeneration(NodeId id) const;
    std::size_t bindingCount() const noexcept { return bindings_.size(); }

    // Drops every binding and expires outstanding handlers.
    void clear();

    std::uint32_t editCount() const noexcept { return edits_; }
    std::uint32_t rejectedCount() const noexcept { return rejected_; }
    std::uint32_t callbackFailures() const noexcept { return callbackFailures_; }

    // NodeObserver
    void onNodeTracked(const SceneNode& node) override;
    void onNodeReleased(NodeId id) override;

private:
    struct FieldBinding {
        FieldCallback original;
    };

    struct NodeBinding {
        std::uint64_t generation;
        std::vector<FieldBinding> fields;
    };

    SyncResult onBoundFieldChange(NodeId id, std::size_t fieldIndex, std::uint64_t generation, const FieldValue& value);
    FieldCallback callbackFor(NodeId id, std::size_t fieldIndex, const SceneNode& node) const;

    SceneSource& scene_;
    NodeLifecycleBridge& bridge_;
    std::unordered_map<NodeId, NodeBinding> bindings_;
    std::uint64_t nextGeneration_{1};
    std::shared_ptr<ValueSync*> lifetime_;
    std::function<void(NodeId)> editListener_;

    std::uint32_t edits_{0};
    std::uint32_t rejected_{0};
    std::uint32_t callbackFailures_{0};
};
