#ifdef EMSCRIPTEN
#include <emscripten/bind.h>
#include <emscripten/emscripten.h>
#include <emscripten/val.h>
#endif

#include "overlay/overlay_engine.h"
#include "overlay/frame/frame_clock.h"
#include "overlay/scene/node_graph.h"
#include "overlay/visibility/visibility_selector.h"

#ifdef EMSCRIPTEN
namespace {

emscripten::val toJs(const FieldValue& value) {
    switch (valueTag(value)) {
        case FieldValueTag::Empty:   return emscripten::val::null();
        case FieldValueTag::Boolean: return emscripten::val(std::get<bool>(value));
        case FieldValueTag::Number:  return emscripten::val(std::get<double>(value));
        case FieldValueTag::Text:    return emscripten::val(std::get<std::string>(value));
        case FieldValueTag::TextList: {
            emscripten::val arr = emscripten::val::array();
            for (const std::string& s : std::get<TextList>(value)) arr.call<void>("push", s);
            return arr;
        }
    }
    return emscripten::val::null();
}

FieldValue fromJs(const emscripten::val& v) {
    if (v.isNull() || v.isUndefined()) return std::monostate{};
    if (v.isTrue() || v.isFalse()) return v.as<bool>();
    if (v.isNumber()) return v.as<double>();
    if (v.isString()) return v.as<std::string>();
    if (v.isArray()) {
        TextList list;
        const unsigned n = v["length"].as<unsigned>();
        for (unsigned i = 0; i < n; ++i) list.push_back(v[i].as<std::string>());
        return list;
    }
    return std::monostate{};
}

emscripten::val snapshotToJs(const NodeSnapshot& snap) {
    emscripten::val node = emscripten::val::object();
    node.set("id", snap.id);
    node.set("x", snap.x);
    node.set("y", snap.y);
    node.set("w", snap.w);
    node.set("h", snap.h);
    node.set("title", snap.title);
    node.set("selected", snap.selected);
    node.set("executing", snap.executing);
    node.set("revision", snap.revision);

    emscripten::val fields = emscripten::val::array();
    for (const FieldSnapshot& f : snap.fields) {
        emscripten::val field = emscripten::val::object();
        field.set("name", f.name);
        field.set("kind", std::string(fieldKindName(f.kind)));
        field.set("value", toJs(f.value));
        field.set("secondary", f.secondary);
        field.set("fallback", f.fallback);
        emscripten::val options = emscripten::val::object();
        for (const auto& kv : f.options) options.set(kv.first, toJs(kv.second));
        field.set("options", options);
        fields.call<void>("push", field);
    }
    node.set("fields", fields);

    auto connectors = [](const std::vector<ConnectorSnapshot>& list) {
        emscripten::val arr = emscripten::val::array();
        for (const ConnectorSnapshot& c : list) {
            emscripten::val conn = emscripten::val::object();
            conn.set("name", c.name);
            conn.set("type", c.type);
            conn.set("linked", c.linked);
            arr.call<void>("push", conn);
        }
        return arr;
    };
    node.set("inputs", connectors(snap.inputs));
    node.set("outputs", connectors(snap.outputs));
    return node;
}

emscripten::val idsToJs(const std::vector<NodeId>& ids) {
    emscripten::val arr = emscripten::val::array();
    for (const NodeId id : ids) arr.call<void>("push", id);
    return arr;
}

} // namespace

// Owns a scene, a rAF clock and the overlay for a page that has no engine of its own.
class OverlayHost : public OverlayRenderer {
public:
    OverlayHost() : overlay_(graph_, clock_) {
        overlay_.setRenderer(this);
        overlay_.attach();
    }
    ~OverlayHost() override {
        overlay_.setRenderer(nullptr);
        overlay_.teardown();
    }

    std::uint32_t addNode(float x, float y, float w, float h, const std::string& title) {
        SceneNode node;
        node.x = x;
        node.y = y;
        node.w = w;
        node.h = h;
        node.title = title;
        return graph_.addNode(std::move(node));
    }
    bool removeNode(std::uint32_t id) { return graph_.removeNode(id); }
    bool moveNode(std::uint32_t id, float x, float y) {
        const bool ok = graph_.moveNode(id, x, y);
        overlay_.requestFrame();
        return ok;
    }
    bool resizeNode(std::uint32_t id, float w, float h) {
        const bool ok = graph_.resizeNode(id, w, h);
        overlay_.requestFrame();
        return ok;
    }
    bool setSelected(std::uint32_t id, bool selected) { return graph_.setSelected(id, selected); }

    bool addField(std::uint32_t id, const std::string& name, const std::string& type, emscripten::val value, emscripten::val options) {
        SceneNode* node = graph_.mutableNode(id);
        if (!node) return false;
        SceneField field;
        field.name = name;
        field.type = type;
        field.value = fromJs(value);
        if (!options.isArray() && !options.isNull() && !options.isUndefined()) {
            const emscripten::val keys = emscripten::val::global("Object").call<emscripten::val>("keys", options);
            const unsigned n = keys["length"].as<unsigned>();
            for (unsigned i = 0; i < n; ++i) {
                const std::string key = keys[i].as<std::string>();
                field.options[key] = fromJs(options[key]);
            }
        }
        node->fields.push_back(std::move(field));
        overlay_.requestFrame();
        return true;
    }

    bool setFieldValue(std::uint32_t id, std::uint32_t index, emscripten::val value) {
        const bool ok = graph_.setFieldValue(id, index, fromJs(value));
        overlay_.requestFrame();
        return ok;
    }

    std::string editField(std::uint32_t id, std::uint32_t index, emscripten::val value) {
        return syncResultName(overlay_.applyFieldEdit(id, index, fromJs(value)));
    }

    void setCamera(float scale, float offsetX, float offsetY) {
        graph_.setCamera(Camera{scale, offsetX, offsetY});
        overlay_.requestFrame();
    }
    void setViewportSize(float w, float h) { overlay_.setViewportSize(w, h); }
    void setContinuous(bool continuous) { overlay_.setContinuous(continuous); }
    void setFrameListener(emscripten::val listener) { listener_ = listener; }

    emscripten::val getFrame() const {
        const OverlayEngine::FramePtr frame = overlay_.currentFrame();
        emscripten::val out = emscripten::val::object();
        out.set("generation", frame->generation);
        out.set("transform", frame->cssTransform);
        emscripten::val nodes = emscripten::val::array();
        for (const auto& visible : frame->nodes) {
            emscripten::val entry = snapshotToJs(*visible.snapshot);
            entry.set("lod", std::string(lodTierName(visible.lod)));
            entry.set("showFields", visible.detail.showFields);
            entry.set("showSecondaryFields", visible.detail.showSecondaryFields);
            entry.set("showPreviews", visible.detail.showPreviews);
            entry.set("showConnectorLabels", visible.detail.showConnectorLabels);
            nodes.call<void>("push", entry);
        }
        out.set("nodes", nodes);
        out.set("entered", idsToJs(frame->entered));
        out.set("exited", idsToJs(frame->exited));
        out.set("refreshed", idsToJs(frame->refreshed));
        return out;
    }

    OverlayEngine::OverlayStats getStats() const { return overlay_.getStats(); }
    OverlayEngine::ProtocolInfo getProtocolInfo() const { return overlay_.getProtocolInfo(); }
    std::uint32_t getLastError() const { return static_cast<std::uint32_t>(overlay_.getLastError()); }

    void onFrame(const overlay::protocol::FramePtr& frame) override {
        if (listener_.isUndefined() || listener_.isNull()) return;
        listener_(frame->generation);
    }

private:
    NodeGraph graph_;
    BrowserFrameClock clock_;
    OverlayEngine overlay_;
    emscripten::val listener_{emscripten::val::undefined()};
};

EMSCRIPTEN_BINDINGS(node_overlay_module) {
    emscripten::value_object<OverlayEngine::ProtocolInfo>("ProtocolInfo")
        .field("protocolVersion", &OverlayEngine::ProtocolInfo::protocolVersion)
        .field("snapshotVersion", &OverlayEngine::ProtocolInfo::snapshotVersion)
        .field("featureFlags", &OverlayEngine::ProtocolInfo::featureFlags);

    emscripten::value_object<OverlayEngine::OverlayStats>("OverlayStats")
        .field("ticks", &OverlayEngine::OverlayStats::ticks)
        .field("failedTicks", &OverlayEngine::OverlayStats::failedTicks)
        .field("frameGeneration", &OverlayEngine::OverlayStats::frameGeneration)
        .field("trackedNodes", &OverlayEngine::OverlayStats::trackedNodes)
        .field("visibleNodes", &OverlayEngine::OverlayStats::visibleNodes)
        .field("culledNodes", &OverlayEngine::OverlayStats::culledNodes)
        .field("refreshedLastTick", &OverlayEngine::OverlayStats::refreshedLastTick)
        .field("extractionErrors", &OverlayEngine::OverlayStats::extractionErrors)
        .field("transformWarnings", &OverlayEngine::OverlayStats::transformWarnings)
        .field("indexRebuilds", &OverlayEngine::OverlayStats::indexRebuilds)
        .field("indexDepth", &OverlayEngine::OverlayStats::indexDepth)
        .field("edits", &OverlayEngine::OverlayStats::edits)
        .field("rejectedEdits", &OverlayEngine::OverlayStats::rejectedEdits)
        .field("callbackFailures", &OverlayEngine::OverlayStats::callbackFailures)
        .field("lastTickMs", &OverlayEngine::OverlayStats::lastTickMs);

    emscripten::class_<OverlayHost>("OverlayHost")
        .constructor<>()
        .function("addNode", &OverlayHost::addNode)
        .function("removeNode", &OverlayHost::removeNode)
        .function("moveNode", &OverlayHost::moveNode)
        .function("resizeNode", &OverlayHost::resizeNode)
        .function("setSelected", &OverlayHost::setSelected)
        .function("addField", &OverlayHost::addField)
        .function("setFieldValue", &OverlayHost::setFieldValue)
        .function("editField", &OverlayHost::editField)
        .function("setCamera", &OverlayHost::setCamera)
        .function("setViewportSize", &OverlayHost::setViewportSize)
        .function("setContinuous", &OverlayHost::setContinuous)
        .function("setFrameListener", &OverlayHost::setFrameListener)
        .function("getFrame", &OverlayHost::getFrame)
        .function("getStats", &OverlayHost::getStats)
        .function("getProtocolInfo", &OverlayHost::getProtocolInfo)
        .function("getLastError", &OverlayHost::getLastError);
}
#endif
