#pragma once

#include "graphlens/render/IGraphRenderer.h"

#include <memory>
#include <stdexcept>

namespace graphlens {

/// Thrown when no usable GL context exists or a GPU object cannot be built
class RenderContextError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief OpenGL ES 3.0 implementation of IGraphRenderer
 *
 * Requires a current GL ES 3 context on the calling thread. Construction
 * compiles and links all three programs and allocates every buffer; any
 * failure throws RenderContextError after releasing what was created.
 */
class GlRenderer : public IGraphRenderer {
public:
    GlRenderer();
    ~GlRenderer() override;

    GlRenderer(const GlRenderer&) = delete;
    GlRenderer& operator=(const GlRenderer&) = delete;

    void setNodePositions(const std::vector<float>& positions) override;
    void setEdgePositions(const std::vector<float>& positions) override;
    void setNodeColors(const std::vector<float>& colors) override;
    void setNodeSizes(const std::vector<float>& sizes) override;
    void setEdgeColors(const std::vector<float>& colors) override;
    void setArrows(const ArrowInstances& arrows) override;
    void setViewport(int width, int height) override;

    void render(const std::array<float, 9>& viewMatrix,
                const Color& background,
                float arrowSizeScale,
                float zoomPixels) override;

private:
    struct Resources;
    std::unique_ptr<Resources> res_;

    size_t nodeCount_ = 0;
    size_t edgeCount_ = 0;
    size_t arrowCount_ = 0;
};

}  // namespace graphlens
