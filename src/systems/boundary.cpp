#include "carrom/systems/boundary.hpp"
#include "carrom/core/profile.hpp"

#include <cmath>

namespace Systems {

bool BoundarySystem::clamp(Components::Position& pos, Components::Velocity& vel, double radius) const {
    const double lo = specificConfig.minCoord + radius;
    const double hi = specificConfig.maxCoord - radius;
    const double restitution = specificConfig.restitution;

    bool bounced = false;

    // Left / right walls
    if (pos.x < lo) {
        pos.x = lo;
        vel.x = std::abs(vel.x) * restitution;
        bounced = true;
    }
    else if (pos.x > hi) {
        pos.x = hi;
        vel.x = -std::abs(vel.x) * restitution;
        bounced = true;
    }

    // Top / bottom walls
    if (pos.y < lo) {
        pos.y = lo;
        vel.y = std::abs(vel.y) * restitution;
        bounced = true;
    }
    else if (pos.y > hi) {
        pos.y = hi;
        vel.y = -std::abs(vel.y) * restitution;
        bounced = true;
    }

    return bounced;
}

void BoundarySystem::update(entt::registry& registry, const DiscList& discs) {
    PROFILE_SCOPE("BoundarySystem");

    for (auto entity : discs) {
        if (registry.any_of<Components::Captured>(entity)) {
            continue;
        }

        auto& pos = registry.get<Components::Position>(entity);
        auto& vel = registry.get<Components::Velocity>(entity);
        const auto& radius = registry.get<Components::Radius>(entity);

        clamp(pos, vel, radius.value);
    }
}

} // namespace Systems
