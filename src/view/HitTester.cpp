#include "graphlens/view/HitTester.h"

#include <algorithm>
#include <limits>

namespace graphlens {

std::optional<NodeId> hitTestNode(const Point& world,
                                  const std::vector<float>& positions,
                                  const std::vector<float>& sizes,
                                  float radiusScale) {
    const size_t count = std::min(sizes.size(), positions.size() / 2);

    std::optional<NodeId> best;
    float bestDistSq = std::numeric_limits<float>::infinity();

    for (size_t i = 0; i < count; ++i) {
        const float radius = sizes[i] * 0.5f * radiusScale;
        const float dx = world.x - positions[i * 2];
        const float dy = world.y - positions[i * 2 + 1];
        const float distSq = dx * dx + dy * dy;
        if (distSq < radius * radius && distSq < bestDistSq) {
            bestDistSq = distSq;
            best = static_cast<NodeId>(i);
        }
    }

    return best;
}

}  // namespace graphlens
