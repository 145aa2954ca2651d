#pragma once

#include "graphlens/core/Types.h"

#include <optional>
#include <vector>

namespace graphlens {

/// Radius multiplier for forgiving pointer hit tests (1.0 = exact disc)
constexpr float HOVER_HIT_BUFFER = 1.5f;

/**
 * @brief Find the node whose disc contains a world-space point
 *
 * @param world Query point in world units
 * @param positions Interleaved x,y node centres
 * @param sizes Node diameters in world units
 * @param radiusScale Multiplier applied to each radius
 * @return Index of the nearest containing node, or nullopt
 *
 * Scans up to the shorter of the two arrays. Containment is strict, so a
 * point exactly on the rim is a miss.
 */
std::optional<NodeId> hitTestNode(const Point& world,
                                  const std::vector<float>& positions,
                                  const std::vector<float>& sizes,
                                  float radiusScale = 1.0f);

}  // namespace graphlens
