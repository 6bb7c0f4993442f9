#include "overlay/sync/value_sync.h"
#include "overlay/core/logging.h"

#include <exception>

const char* syncResultName(SyncResult result) {
    switch (result) {
        case SyncResult::Ok:             return "ok";
        case SyncResult::NodeMissing:    return "node-missing";
        case SyncResult::FieldMissing:   return "field-missing";
        case SyncResult::TypeMismatch:   return "type-mismatch";
        case SyncResult::CallbackFailed: return "callback-failed";
    }
    return "unknown";
}

ValueSync::ValueSync(SceneSource& scene, NodeLifecycleBridge& bridge)
    : scene_(scene), bridge_(bridge), lifetime_(std::make_shared<ValueSync*>(this)) {
    bridge_.addObserver(this);
}

ValueSync::~ValueSync() {
    bridge_.removeObserver(this);
}

FieldChangeHandler ValueSync::handlerFor(NodeId id, std::size_t fieldIndex) const {
    std::weak_ptr<ValueSync*> token = lifetime_;
    const std::uint64_t generation = bindingGeneration(id);
    return [token, id, fieldIndex, generation](const FieldValue& value) {
        const std::shared_ptr<ValueSync*> self = token.lock();
        if (!self) return SyncResult::NodeMissing;
        return (*self)->onBoundFieldChange(id, fieldIndex, generation, value);
    };
}

SyncResult ValueSync::onBoundFieldChange(NodeId id, std::size_t fieldIndex, std::uint64_t generation, const FieldValue& value) {
    if (bindingGeneration(id) != generation) {
        OVERLAY_LOG_WARN("stale handler for node %u field %zu ignored", id, fieldIndex);
        rejected_++;
        return SyncResult::NodeMissing;
    }
    return onFieldChange(id, fieldIndex, value);
}

FieldCallback ValueSync::callbackFor(NodeId id, std::size_t fieldIndex, const SceneNode& node) const {
    const auto it = bindings_.find(id);
    if (it != bindings_.end() && fieldIndex < it->second.fields.size()) {
        return it->second.fields[fieldIndex].original;
    }
    // Field appeared after the node was bound.
    return node.fields[fieldIndex].callback;
}

SyncResult ValueSync::onFieldChange(NodeId id, std::size_t fieldIndex, const FieldValue& value) {
    const SnapshotPtr snap = bridge_.snapshot(id);
    const SceneNode* node = scene_.findNode(id);
    if (!snap || !node) {
        rejected_++;
        return SyncResult::NodeMissing;
    }
    if (fieldIndex >= snap->fields.size() || fieldIndex >= node->fields.size()) {
        rejected_++;
        return SyncResult::FieldMissing;
    }
    if (!isValueCompatible(snap->fields[fieldIndex].kind, value)) {
        OVERLAY_LOG_WARN("edit of node %u field %zu rejected: %s does not accept this value",
            id, fieldIndex, fieldKindName(snap->fields[fieldIndex].kind));
        rejected_++;
        return SyncResult::TypeMismatch;
    }

    const FieldCallback original = callbackFor(id, fieldIndex, *node);

    // 1. authority first
    const std::uint64_t beforeWrite = bridge_.liveValueChecksum(id);
    if (!scene_.writeFieldValue(id, fieldIndex, value)) {
        rejected_++;
        return SyncResult::FieldMissing;
    }
    const std::uint64_t afterWrite = bridge_.liveValueChecksum(id);

    // 2. the engine's own hook
    SyncResult result = SyncResult::Ok;
    if (original) {
        try {
            original(value);
        } catch (const std::exception& e) {
            OVERLAY_LOG_WARN("callback of node %u field %zu threw: %s", id, fieldIndex, e.what());
            callbackFailures_++;
            result = SyncResult::CallbackFailed;
        } catch (...) {
            OVERLAY_LOG_WARN("callback of node %u field %zu threw a non-standard exception", id, fieldIndex);
            callbackFailures_++;
            result = SyncResult::CallbackFailed;
        }
    }

    // 3. snapshot
    bridge_.applyLocalEdit(id, fieldIndex, value, EditChecksums{beforeWrite, afterWrite});
    edits_++;
    if (editListener_) editListener_(id);
    return result;
}

bool ValueSync::hasBindings(NodeId id) const {
    return bindings_.find(id) != bindings_.end();
}

std::uint64_t ValueSync::bindingGeneration(NodeId id) const {
    const auto it = bindings_.find(id);
    return it == bindings_.end() ? 0 : it->second.generation;
}

void ValueSync::clear() {
    bindings_.clear();
    lifetime_ = std::make_shared<ValueSync*>(this);
}

void ValueSync::onNodeTracked(const SceneNode& node) {
    std::vector<FieldBinding> fields;
    fields.reserve(node.fields.size());
    for (const SceneField& field : node.fields) {
        fields.push_back(FieldBinding{field.callback});
    }
    bindings_[node.id] = NodeBinding{nextGeneration_++, std::move(fields)};
}

void ValueSync::onNodeReleased(NodeId id) {
    bindings_.erase(id);
}
