#include "carrom/systems/collision.hpp"
#include "carrom/core/debug.hpp"
#include "carrom/core/profile.hpp"

#include <cstddef>

namespace Systems {

bool CollisionSystem::resolvePair(entt::registry& registry, entt::entity a, entt::entity b, bool applyImpulse) {
    if (registry.any_of<Components::Captured>(a) || registry.any_of<Components::Captured>(b)) {
        return false;
    }

    auto& posA = registry.get<Components::Position>(a);
    auto& posB = registry.get<Components::Position>(b);
    const double rA = registry.get<Components::Radius>(a).value;
    const double rB = registry.get<Components::Radius>(b).value;

    Vector const delta = posB - posA;
    const double dist = delta.length();
    const double minDist = rA + rB;
    if (dist >= minDist) {
        return false;
    }

    // Coincident centres have no direction; any fixed normal separates them
    Vector const n = (dist < EPSILON) ? Vector(1.0, 0.0) : delta.normalized();

    if (applyImpulse) {
        auto& velA = registry.get<Components::Velocity>(a);
        auto& velB = registry.get<Components::Velocity>(b);

        const double closingSpeed = (velA - velB).dotProduct(n);
        if (closingSpeed < 0.0) {
            return false;
        }

        const double j = 2.0 * closingSpeed / minDist;
        velA -= n * (j * rB);
        velB += n * (j * rA);

        const auto& tagA = registry.get<Components::DiscTag>(a);
        const auto& tagB = registry.get<Components::DiscTag>(b);
        if (closingSpeed > specificConfig.impactEffectThreshold) {
            if (tagA.kind == Components::DiscKind::Striker) {
                impactEvents.push_back({posA + Position(n.x * rA, n.y * rA), closingSpeed, tagB.kind, tagB.id});
            } else if (tagB.kind == Components::DiscKind::Striker) {
                impactEvents.push_back({posB - Position(n.x * rB, n.y * rB), closingSpeed, tagA.kind, tagA.id});
            }
        }

        CARROM_DEBUG_MSG(CARROM_DEBUG_LEVEL_VERBOSE,
            "collision " << tagA.id << "-" << tagB.id << " closing=" << closingSpeed << "\n");
    }

    const double halfOverlap = (minDist - dist) / 2.0;
    posA -= n * halfOverlap;
    posB += n * halfOverlap;
    return true;
}

void CollisionSystem::update(entt::registry& registry, const DiscList& discs) {
    PROFILE_SCOPE("CollisionSystem");

    impactEvents.clear();

    for (std::size_t i = 0; i < discs.size(); ++i) {
        for (std::size_t j = i + 1; j < discs.size(); ++j) {
            resolvePair(registry, discs[i], discs[j], true);
        }
    }

    for (int pass = 0; pass < specificConfig.relaxationPasses; ++pass) {
        bool anyOverlap = false;
        for (std::size_t i = 0; i < discs.size(); ++i) {
            for (std::size_t j = i + 1; j < discs.size(); ++j) {
                anyOverlap = resolvePair(registry, discs[i], discs[j], false) || anyOverlap;
            }
        }
        if (!anyOverlap) {
            break;
        }
    }
}

} // namespace Systems
