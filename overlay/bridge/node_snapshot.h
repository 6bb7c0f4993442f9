#pragma once

#include "overlay/core/types.h"
#include "overlay/field/field_value.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

// Plain-data copies handed to the reactive layer. Never mutated after publish;
// a changed node gets a new NodeSnapshot.

struct FieldSnapshot {
    std::string name;
    FieldKind kind{FieldKind::InputText};
    FieldValue value;
    FieldOptions options;
    bool secondary{false};   // options.advanced
    bool fallback{false};    // substituted after a read failure or type mismatch
    bool hasCallback{false}; // the engine registered its own change hook
};

struct ConnectorSnapshot {
    std::string name;
    std::string type;
    bool linked{false};
};

struct NodeSnapshot {
    NodeId id{invalidNodeId};
    float x{0.0f};
    float y{0.0f};
    float w{0.0f};
    float h{0.0f};
    std::string title;
    bool selected{false};
    bool executing{false};
    std::vector<FieldSnapshot> fields;
    std::vector<ConnectorSnapshot> inputs;
    std::vector<ConnectorSnapshot> outputs;
    std::uint32_t revision{0};
};

using SnapshotPtr = std::shared_ptr<const NodeSnapshot>;

// Cheap per-node change detector; compared every tick.
struct NodeFingerprint {
    float x, y, w, h;
    std::uint32_t fieldCount;
    std::uint32_t connectorCount;
    std::uint32_t flags;          // bit 0 selected, bit 1 executing
    std::uint64_t valueChecksum;
    std::uint64_t titleHash;

    bool operator==(const NodeFingerprint& o) const {
        return x == o.x && y == o.y && w == o.w && h == o.h
            && fieldCount == o.fieldCount
            && connectorCount == o.connectorCount
            && flags == o.flags
            && valueChecksum == o.valueChecksum
            && titleHash == o.titleHash;
    }
    bool operator!=(const NodeFingerprint& o) const { return !(*this == o); }
};

struct VisibilityState {
    bool visible{false};
    bool culled{false};
    bool classified{false}; // false until the first tick after the node was added
    LodTier lod{LodTier::Minimal};
};
