#pragma once

#include "overlay/bridge/node_snapshot.h"
#include "overlay/scene/scene_source.h"

#include <cstdint>

struct ExtractionReport {
    std::uint32_t fallbackFields{0};
    std::uint32_t sanitizedGeometry{0};
};

// Reads a field's current value, going through the engine accessor when one is
// set. Returns false (and leaves `out` empty) when the accessor throws.
bool readFieldValue(const SceneField& field, FieldValue& out);

// Copies every field, connector and geometry value out of the engine node.
// Malformed fields are substituted, never dropped.
NodeSnapshot extractSnapshot(const SceneNode& node, std::uint32_t revision, ExtractionReport& report);

FieldSnapshot extractField(const SceneField& field, ExtractionReport& report);

NodeFingerprint computeFingerprint(const SceneNode& node);

// Scene bounds of the node, with non-finite geometry collapsed to the origin.
AABB nodeBounds(const SceneNode& node);
AABB snapshotBounds(const NodeSnapshot& snapshot);
