#include "carrom/systems/movement.hpp"
#include "carrom/core/profile.hpp"

namespace Systems {

void MovementSystem::integrate(Components::Position& pos, Components::Velocity& vel,
                               double friction, double restThreshold) {
    vel *= friction;

    if (vel.length() < restThreshold) {
        vel = Components::Velocity(0.0, 0.0);
    }

    pos += vel;
}

void MovementSystem::update(entt::registry& registry, const DiscList& discs) {
    PROFILE_SCOPE("MovementSystem");

    for (auto entity : discs) {
        if (registry.any_of<Components::Captured>(entity)) {
            continue;
        }

        auto& pos = registry.get<Components::Position>(entity);
        auto& vel = registry.get<Components::Velocity>(entity);
        const auto& friction = registry.get<Components::Friction>(entity);

        integrate(pos, vel, friction.coefficient, specificConfig.restThreshold);
    }
}

} // namespace Systems
