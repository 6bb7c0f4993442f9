#pragma once

#include "overlay/core/types.h"
#include <cstdint>

// Runtime tuning for the overlay core. Set programmatically by the host.
struct OverlayConfig {
    // Spatial index
    std::uint32_t maxDepth{defaultIndexMaxDepth};
    std::uint32_t leafCapacity{defaultIndexLeafCapacity};
    std::uint32_t stalenessThreshold{defaultIndexStalenessThreshold};
    std::uint32_t overflowRebuildLimit{defaultIndexOverflowRebuildLimit};
    float rootHalfExtent{defaultIndexRootHalfExtent};

    // Viewport in overlay pixels
    float viewportWidth{defaultViewportWidth};
    float viewportHeight{defaultViewportHeight};

    // Zoom-adaptive culling margin, as a fraction of each viewport dimension
    float marginLowZoom{defaultMarginLowZoom};
    float marginHighZoom{defaultMarginHighZoom};
    float marginLowZoomScale{defaultMarginLowZoomScale};
    float marginHighZoomScale{defaultMarginHighZoomScale};

    // LOD bands: scale > lodFullScale is Full, scale >= lodReducedScale is Reduced
    float lodFullScale{defaultLodFullScale};
    float lodReducedScale{defaultLodReducedScale};

    // Larger on-screen dimension below this is culled
    float minPixelSize{defaultMinPixelSize};
};

// Clamps every field into its legal range. Returns true when something had to change.
bool sanitizeConfig(OverlayConfig& config);
