#pragma once

#include "graphlens/core/Types.h"

#include <array>
#include <vector>

namespace graphlens {

/// Per-instance arrow-head attributes, parallel arrays
struct ArrowInstances {
    std::vector<float> targets;      ///< x,y of the target node centre
    std::vector<float> directions;   ///< source-to-target vector, not normalised
    std::vector<float> colors;       ///< RGBA
    std::vector<float> targetSizes;  ///< target node diameter, world units

    size_t count() const { return targetSizes.size(); }
    bool empty() const { return targetSizes.empty(); }
};

/**
 * @brief GPU-side drawing contract for the graph view
 *
 * Static buffers (positions) are set once per dataset; dynamic buffers
 * (colours, sizes, arrows) whenever highlighting changes. render() draws
 * edges, then arrow heads, then nodes.
 */
class IGraphRenderer {
public:
    virtual ~IGraphRenderer() = default;

    /// Interleaved x,y per node
    virtual void setNodePositions(const std::vector<float>& positions) = 0;
    /// Interleaved x0,y0,x1,y1 per edge
    virtual void setEdgePositions(const std::vector<float>& positions) = 0;

    /// RGBA per node
    virtual void setNodeColors(const std::vector<float>& colors) = 0;
    /// Diameter per node, world units
    virtual void setNodeSizes(const std::vector<float>& sizes) = 0;
    /// RGBA per edge vertex (two per edge)
    virtual void setEdgeColors(const std::vector<float>& colors) = 0;
    virtual void setArrows(const ArrowInstances& arrows) = 0;

    /// Drawable size in pixels
    virtual void setViewport(int width, int height) = 0;

    /**
     * @param viewMatrix Column-major world-to-clip matrix
     * @param background Clear colour
     * @param arrowSizeScale User arrow size multiplier
     * @param zoomPixels Camera zoom times the device pixel ratio
     */
    virtual void render(const std::array<float, 9>& viewMatrix,
                        const Color& background,
                        float arrowSizeScale,
                        float zoomPixels) = 0;
};

}  // namespace graphlens
