#pragma once

#include "graphlens/analysis/CoverageNet.h"
#include "graphlens/core/Types.h"

#include <optional>
#include <unordered_map>
#include <unordered_set>

namespace graphlens {

/**
 * @brief Keeps nodes from a recent hover net alive for a short while
 *
 * Every update with a hovered node stamps that node and its whole hover
 * net with the current time. Entries older than HOVER_DECAY_MS are pruned.
 */
class RecentHoverTracker {
public:
    static constexpr double HOVER_DECAY_MS = 500.0;

    void update(double nowMs, std::optional<NodeId> hovered, const CoverageNet& hoverNet);
    void clear() { lastSeen_.clear(); }

    bool contains(NodeId id) const { return lastSeen_.count(id) > 0; }
    bool empty() const { return lastSeen_.empty(); }
    size_t size() const { return lastSeen_.size(); }

    std::unordered_set<NodeId> snapshot() const;

private:
    std::unordered_map<NodeId, double> lastSeen_;
};

/// Suppresses label hover while the cursor rests where a label appeared
class HoverLock {
public:
    /// Squared cursor travel (logical px) that releases the lock
    static constexpr float RELEASE_DISTANCE_SQ = 9.0f;

    void engage(const Point& cursor) { anchor_ = cursor; }
    void release() { anchor_.reset(); }
    bool isLocked() const { return anchor_.has_value(); }

    /// Releases the lock once the cursor has moved far enough
    void onPointerMove(const Point& cursor);

private:
    std::optional<Point> anchor_;
};

}  // namespace graphlens
