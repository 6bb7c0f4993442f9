#include "overlay/scene/node_graph.h"
#include "overlay/core/logging.h"

#include <algorithm>

template <typename Fn>
void NodeGraph::notify(Fn&& fn) {
    // Listeners may unsubscribe while being notified.
    const auto snapshot = listeners_;
    for (const auto& entry : snapshot) {
        const bool stillSubscribed = std::any_of(listeners_.begin(), listeners_.end(),
            [&](const auto& live) { return live.first == entry.first; });
        if (stillSubscribed) fn(*entry.second);
    }
}

void NodeGraph::clear() noexcept {
    nodes_.clear();
    order_.clear();
    camera_ = Camera{};
    nextNodeId_ = 1;
    fieldWriteCount_ = 0;
}

NodeId NodeGraph::addNode(SceneNode node) {
    if (node.id == invalidNodeId) {
        while (nodes_.find(nextNodeId_) != nodes_.end()) nextNodeId_++;
        node.id = nextNodeId_++;
    } else if (nodes_.find(node.id) != nodes_.end()) {
        OVERLAY_LOG_WARN("addNode: id %u already present", node.id);
        return invalidNodeId;
    }

    const NodeId id = node.id;
    auto owned = std::make_unique<SceneNode>(std::move(node));
    const SceneNode& ref = *owned;
    nodes_.emplace(id, std::move(owned));
    order_.push_back(id);

    notify([&](SceneListener& l) { l.onNodeAdded(ref); });
    return id;
}

bool NodeGraph::removeNode(NodeId id) {
    auto it = nodes_.find(id);
    if (it == nodes_.end()) return false;

    // Listeners observe the node while it is still alive.
    notify([&](SceneListener& l) { l.onNodeRemoved(*it->second); });

    it = nodes_.find(id);
    if (it != nodes_.end()) nodes_.erase(it);
    order_.erase(std::remove(order_.begin(), order_.end(), id), order_.end());
    return true;
}

SceneNode* NodeGraph::mutableNode(NodeId id) {
    const auto it = nodes_.find(id);
    return it == nodes_.end() ? nullptr : it->second.get();
}

const SceneNode* NodeGraph::findNode(NodeId id) const {
    const auto it = nodes_.find(id);
    return it == nodes_.end() ? nullptr : it->second.get();
}

bool NodeGraph::moveNode(NodeId id, float x, float y) {
    SceneNode* node = mutableNode(id);
    if (!node) return false;
    node->x = x;
    node->y = y;
    return true;
}

bool NodeGraph::resizeNode(NodeId id, float w, float h) {
    SceneNode* node = mutableNode(id);
    if (!node) return false;
    node->w = w;
    node->h = h;
    return true;
}

bool NodeGraph::setTitle(NodeId id, const std::string& title) {
    SceneNode* node = mutableNode(id);
    if (!node) return false;
    node->title = title;
    return true;
}

bool NodeGraph::setSelected(NodeId id, bool selected) {
    SceneNode* node = mutableNode(id);
    if (!node) return false;
    if (node->selected == selected) return true;
    node->selected = selected;
    notify([&](SceneListener& l) { l.onNodeSelected(*node, selected); });
    return true;
}

bool NodeGraph::setExecuting(NodeId id, bool executing) {
    SceneNode* node = mutableNode(id);
    if (!node) return false;
    if (node->executing == executing) return true;
    node->executing = executing;
    notify([&](SceneListener& l) { l.onNodeExecuting(*node, executing); });
    return true;
}

bool NodeGraph::setFieldValue(NodeId id, std::size_t fieldIndex, const FieldValue& value) {
    SceneNode* node = mutableNode(id);
    if (!node || fieldIndex >= node->fields.size()) return false;
    node->fields[fieldIndex].value = value;
    return true;
}

void NodeGraph::forEachNode(const std::function<void(const SceneNode&)>& fn) const {
    for (const NodeId id : order_) {
        const auto it = nodes_.find(id);
        if (it != nodes_.end()) fn(*it->second);
    }
}

bool NodeGraph::writeFieldValue(NodeId id, std::size_t fieldIndex, const FieldValue& value) {
    SceneNode* node = mutableNode(id);
    if (!node || fieldIndex >= node->fields.size()) return false;
    node->fields[fieldIndex].value = value;
    fieldWriteCount_++;
    return true;
}

SubscriptionId NodeGraph::subscribe(SceneListener* listener) {
    if (!listener) return invalidSubscriptionId;
    const SubscriptionId id = nextSubscriptionId_++;
    listeners_.emplace_back(id, listener);
    return id;
}

void NodeGraph::unsubscribe(SubscriptionId id) {
    listeners_.erase(
        std::remove_if(listeners_.begin(), listeners_.end(),
            [id](const auto& entry) { return entry.first == id; }),
        listeners_.end());
}
