#include "carrom/systems/pocket.hpp"
#include "carrom/core/debug.hpp"
#include "carrom/core/profile.hpp"

namespace Systems {

bool PocketSystem::insidePocket(const Components::Position& pos) const {
    const double captureDistance = specificConfig.pocketRadius - specificConfig.captureMargin;
    for (const auto& pocket : specificConfig.pockets) {
        if (pos.dist(pocket) < captureDistance) {
            return true;
        }
    }
    return false;
}

void PocketSystem::update(entt::registry& registry, const DiscList& discs) {
    PROFILE_SCOPE("PocketSystem");

    capturedDiscs.clear();

    for (auto entity : discs) {
        if (registry.any_of<Components::Captured>(entity)) {
            continue;
        }

        if (!insidePocket(registry.get<Components::Position>(entity))) {
            continue;
        }

        registry.get<Components::Velocity>(entity) = Components::Velocity(0.0, 0.0);
        registry.emplace<Components::Captured>(entity);
        capturedDiscs.push_back(entity);

        CARROM_DEBUG_MSG(CARROM_DEBUG_LEVEL_BASIC,
            "captured disc " << registry.get<Components::DiscTag>(entity).id << "\n");
    }
}

} // namespace Systems
