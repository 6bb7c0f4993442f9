/**
 * @file protocol_types.h
 * @brief Types handed to the reactive layer (JS or native renderer).
 *
 * Changes to these types require a protocol or snapshot version bump in
 * OverlayEngine and in the reactive layer's handshake check.
 */

#ifndef NODEOVERLAY_PROTOCOL_TYPES_H
#define NODEOVERLAY_PROTOCOL_TYPES_H

#include "overlay/bridge/node_snapshot.h"
#include "overlay/transform/transform_mirror.h"
#include "overlay/visibility/visibility_selector.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace overlay {
namespace protocol {

// =============================================================================
// Feature Flags (protocol handshake)
// =============================================================================

enum class FeatureFlags : std::uint32_t {
    FEATURE_PROTOCOL = 1 << 0,
    FEATURE_LOD_HINTS = 1 << 1,
    FEATURE_FRAME_DIFF = 1 << 2,
    FEATURE_VALUE_SYNC = 1 << 3,
    FEATURE_WIDGET_OPTIONS = 1 << 4,
};

// Handshake payload (POD): the reactive layer checks versions + feature flags.
struct ProtocolInfo {
    std::uint32_t protocolVersion;
    std::uint32_t snapshotVersion;
    std::uint32_t featureFlags;
};

struct OverlayStats {
    std::uint32_t ticks;
    std::uint32_t failedTicks;
    std::uint32_t frameGeneration;
    std::uint32_t trackedNodes;
    std::uint32_t visibleNodes;
    std::uint32_t culledNodes;
    std::uint32_t refreshedLastTick;
    std::uint32_t extractionErrors;
    std::uint32_t transformWarnings;
    std::uint32_t indexRebuilds;
    std::uint32_t indexDepth;
    std::uint32_t edits;
    std::uint32_t rejectedEdits;
    std::uint32_t callbackFailures;
    float lastTickMs;
};

// =============================================================================
// Frame
// =============================================================================

struct VisibleNode {
    SnapshotPtr snapshot;
    LodTier lod;
    LodDetail detail;
    AABB screenBounds; // overlay pixels
};

// Immutable once published; each publish replaces the whole object.
struct OverlayFrame {
    std::uint32_t generation{0};
    ViewTransform transform{};
    std::string cssTransform;
    std::vector<VisibleNode> nodes;   // engine order
    std::vector<NodeId> entered;      // visible now, not in the previous frame
    std::vector<NodeId> exited;       // in the previous frame, gone now
    std::vector<NodeId> refreshed;    // visible in both with a new snapshot
};

using FramePtr = std::shared_ptr<const OverlayFrame>;

} // namespace protocol
} // namespace overlay

#endif // NODEOVERLAY_PROTOCOL_TYPES_H
