#pragma once

#include "overlay/core/types.h"
#include "overlay/field/field_value.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

// Interface of the authoritative scene engine. The overlay core reads nodes
// through it and never owns them.

struct Camera {
    float scale{1.0f};
    float offsetX{0.0f};
    float offsetY{0.0f};
};

using FieldCallback = std::function<void(const FieldValue&)>;
using FieldAccessor = std::function<FieldValue()>;

struct SceneField {
    std::string name;
    std::string type;       // engine type tag, parsed with parseFieldKind()
    FieldValue value;
    FieldOptions options;
    FieldCallback callback; // engine-side change hook, may be empty
    FieldAccessor accessor; // when set, the value is computed by the engine and may throw
};

struct SceneConnector {
    std::string name;
    std::string type;
    bool linked{false};
};

struct SceneNode {
    NodeId id{invalidNodeId};
    float x{0.0f};
    float y{0.0f};
    float w{0.0f};
    float h{0.0f};
    std::string title;
    bool selected{false};
    bool executing{false};
    std::vector<SceneField> fields;
    std::vector<SceneConnector> inputs;
    std::vector<SceneConnector> outputs;
};

class SceneListener {
public:
    virtual ~SceneListener() = default;
    virtual void onNodeAdded(const SceneNode& node) = 0;
    virtual void onNodeRemoved(const SceneNode& node) = 0;
    virtual void onNodeSelected(const SceneNode& node, bool selected) = 0;
    virtual void onNodeExecuting(const SceneNode& node, bool executing) = 0;
};

using SubscriptionId = std::uint32_t;
static constexpr SubscriptionId invalidSubscriptionId = 0;

class SceneSource {
public:
    virtual ~SceneSource() = default;

    virtual Camera camera() const = 0;

    virtual const SceneNode* findNode(NodeId id) const = 0;

    // Live nodes in engine order.
    virtual void forEachNode(const std::function<void(const SceneNode&)>& fn) const = 0;

    // Write-back path for UI edits. Returns false when the node or field is gone.
    // Must not invoke the field's callback.
    virtual bool writeFieldValue(NodeId id, std::size_t fieldIndex, const FieldValue& value) = 0;

    virtual SubscriptionId subscribe(SceneListener* listener) = 0;
    virtual void unsubscribe(SubscriptionId id) = 0;
};
