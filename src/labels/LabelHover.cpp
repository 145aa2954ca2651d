#include "graphlens/labels/LabelHover.h"

namespace graphlens {

void RecentHoverTracker::update(double nowMs, std::optional<NodeId> hovered,
                                const CoverageNet& hoverNet) {
    if (hovered) {
        lastSeen_[*hovered] = nowMs;
        for (const auto& [id, distance] : hoverNet.nodeDistances) {
            lastSeen_[id] = nowMs;
        }
    }

    for (auto it = lastSeen_.begin(); it != lastSeen_.end();) {
        if (nowMs - it->second > HOVER_DECAY_MS) {
            it = lastSeen_.erase(it);
        } else {
            ++it;
        }
    }
}

std::unordered_set<NodeId> RecentHoverTracker::snapshot() const {
    std::unordered_set<NodeId> ids;
    ids.reserve(lastSeen_.size());
    for (const auto& [id, time] : lastSeen_) {
        ids.insert(id);
    }
    return ids;
}

void HoverLock::onPointerMove(const Point& cursor) {
    if (!anchor_) {
        return;
    }
    if ((cursor - *anchor_).lengthSquared() > RELEASE_DISTANCE_SQ) {
        anchor_.reset();
    }
}

}  // namespace graphlens
