#include "overlay/bridge/snapshot_extractor.h"
#include "overlay/core/digest.h"
#include "overlay/core/logging.h"
#include "overlay/core/util.h"
#include "overlay/field/widget_props.h"

#include <exception>

using overlay::kDigestOffset;
using overlay::hashU32;
using overlay::hashString;

namespace {
    constexpr std::uint32_t kUnreadableValueMarker = 0x44414552u; // "READ"

    float finiteOr(float v, float fallback, bool& sanitized) {
        if (isFiniteF32(v)) return v;
        sanitized = true;
        return fallback;
    }

    struct Geometry {
        float x, y, w, h;
        bool sanitized;
    };

    Geometry sanitizeGeometry(const SceneNode& node) {
        Geometry g{0.0f, 0.0f, 0.0f, 0.0f, false};
        g.x = finiteOr(node.x, 0.0f, g.sanitized);
        g.y = finiteOr(node.y, 0.0f, g.sanitized);
        g.w = finiteOr(node.w, 0.0f, g.sanitized);
        g.h = finiteOr(node.h, 0.0f, g.sanitized);
        if (g.w < 0.0f) { g.w = 0.0f; g.sanitized = true; }
        if (g.h < 0.0f) { g.h = 0.0f; g.sanitized = true; }
        return g;
    }

    std::vector<ConnectorSnapshot> copyConnectors(const std::vector<SceneConnector>& connectors) {
        std::vector<ConnectorSnapshot> out;
        out.reserve(connectors.size());
        for (const SceneConnector& c : connectors) {
            out.push_back(ConnectorSnapshot{c.name, c.type, c.linked});
        }
        return out;
    }
}

bool readFieldValue(const SceneField& field, FieldValue& out) {
    if (!field.accessor) {
        out = field.value;
        return true;
    }
    try {
        out = field.accessor();
        return true;
    } catch (const std::exception& e) {
        OVERLAY_LOG_WARN("field '%s' accessor threw: %s", field.name.c_str(), e.what());
        out = std::monostate{};
        return false;
    } catch (...) {
        OVERLAY_LOG_WARN("field '%s' accessor threw a non-standard exception", field.name.c_str());
        out = std::monostate{};
        return false;
    }
}

FieldSnapshot extractField(const SceneField& field, ExtractionReport& report) {
    FieldSnapshot out;
    out.name = field.name;
    out.hasCallback = static_cast<bool>(field.callback);

    FieldValue value;
    const bool readable = readFieldValue(field, value);

    FieldKind kind = parseFieldKind(field.type);
    bool usable = readable;
    if (usable && kind == FieldKind::Unknown) {
        // Unknown tags render as text when the payload allows it.
        kind = FieldKind::InputText;
        usable = isValueCompatible(kind, value);
    } else if (usable) {
        usable = isValueCompatible(kind, value);
    }

    if (!usable) {
        if (readable) {
            OVERLAY_LOG_WARN("field '%s' (type '%s') holds an unexpected value; substituting text",
                field.name.c_str(), field.type.c_str());
        }
        kind = FieldKind::InputText;
        value = std::monostate{};
        out.fallback = true;
        report.fallbackFields++;
    }

    out.kind = kind;
    out.value = std::move(value);
    out.options = sanitizeOptions(kind, field.options);
    out.secondary = optionFlag(out.options, "advanced");
    return out;
}

NodeSnapshot extractSnapshot(const SceneNode& node, std::uint32_t revision, ExtractionReport& report) {
    NodeSnapshot snap;
    snap.id = node.id;

    const Geometry g = sanitizeGeometry(node);
    if (g.sanitized) {
        OVERLAY_LOG_WARN("node %u has invalid geometry; clamped", node.id);
        report.sanitizedGeometry++;
    }
    snap.x = g.x;
    snap.y = g.y;
    snap.w = g.w;
    snap.h = g.h;

    snap.title = node.title;
    snap.selected = node.selected;
    snap.executing = node.executing;

    snap.fields.reserve(node.fields.size());
    for (const SceneField& field : node.fields) {
        snap.fields.push_back(extractField(field, report));
    }
    snap.inputs = copyConnectors(node.inputs);
    snap.outputs = copyConnectors(node.outputs);
    snap.revision = revision;
    return snap;
}

NodeFingerprint computeFingerprint(const SceneNode& node) {
    const Geometry g = sanitizeGeometry(node);

    std::uint64_t h = kDigestOffset;
    for (const SceneField& field : node.fields) {
        h = hashString(h, field.name);
        h = hashString(h, field.type);
        h = hashU32(h, static_cast<std::uint32_t>(field.options.size()));
        for (const auto& option : field.options) {
            h = hashString(h, option.first);
            h = hashFieldValue(h, option.second);
        }
        FieldValue value;
        if (readFieldValue(field, value)) {
            h = hashFieldValue(h, value);
        } else {
            h = hashU32(h, kUnreadableValueMarker);
        }
    }
    for (const SceneConnector& c : node.inputs) h = hashU32(h, c.linked ? 1u : 0u);
    for (const SceneConnector& c : node.outputs) h = hashU32(h, c.linked ? 1u : 0u);

    std::uint32_t flags = 0;
    if (node.selected) flags |= 1u;
    if (node.executing) flags |= 2u;

    return NodeFingerprint{
        g.x, g.y, g.w, g.h,
        static_cast<std::uint32_t>(node.fields.size()),
        static_cast<std::uint32_t>(node.inputs.size() + node.outputs.size()),
        flags,
        h,
        hashString(kDigestOffset, node.title)
    };
}

AABB nodeBounds(const SceneNode& node) {
    const Geometry g = sanitizeGeometry(node);
    return makeBounds(g.x, g.y, g.w, g.h);
}

AABB snapshotBounds(const NodeSnapshot& snapshot) {
    return makeBounds(snapshot.x, snapshot.y, snapshot.w, snapshot.h);
}
