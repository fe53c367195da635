/**
 * @file collision.hpp
 * @brief Pairwise disc-disc collision response
 *
 * This system handles:
 * - Overlap detection between every unordered pair of non-captured discs
 * - An equal-footing elastic impulse along the contact normal, where each
 *   disc's velocity change is scaled by the other disc's radius
 * - Splitting the overlap evenly between the two discs
 * - Additional positional relaxation passes for chained contacts
 * - Cosmetic impact events when the striker hits something hard enough
 *
 * Pairs are visited in ascending list order: (0,1), (0,2) ... (1,2) ...
 * Resolving one pair can change the outcome of a later one in the same
 * tick; the fixed order keeps replays bit-identical.
 *
 * Required components:
 * - Position, Velocity (to modify)
 * - Radius, DiscTag (to read)
 */

#ifndef CARROM_COLLISION_SYSTEM_HPP
#define CARROM_COLLISION_SYSTEM_HPP

#include <vector>
#include <entt/entt.hpp>
#include "carrom/components/basic.hpp"
#include "carrom/systems/i_system.hpp"

namespace Systems {

/**
 * @struct ImpactEvent
 * @brief Striker contact worth a visual effect. No gameplay meaning.
 */
struct ImpactEvent {
    Components::Position point;
    double closingSpeed = 0.0;
    Components::DiscKind struckKind = Components::DiscKind::RegularLight;
    int struckId = 0;
};

/**
 * @struct CollisionConfig
 * @brief Configuration parameters specific to the collision system
 */
struct CollisionConfig {
    // Closing speed above which a striker contact emits an ImpactEvent
    double impactEffectThreshold = 0.5;

    // Overlap-only passes run after the impulse pass
    int relaxationPasses = 8;

    static CollisionConfig fromBoard(const BoardConfig& board) {
        CollisionConfig cfg;
        cfg.impactEffectThreshold = board.impactEffectThreshold;
        cfg.relaxationPasses = board.relaxationPasses;
        return cfg;
    }
};

/**
 * @class CollisionSystem
 * @brief Resolves disc-disc contacts for one tick
 */
class CollisionSystem : public ConfigurableSystem<CollisionConfig> {
public:
    CollisionSystem() = default;
    ~CollisionSystem() override = default;

    /**
     * @brief Runs the impulse pass and the relaxation passes
     *
     * Impact events from this call replace those of the previous call.
     */
    void update(entt::registry& registry, const DiscList& discs) override;

    /**
     * @brief Resolves a single pair
     *
     * @param applyImpulse false for a relaxation pass (overlap split only)
     * @return true if the pair overlapped and was acted on
     */
    bool resolvePair(entt::registry& registry, entt::entity a, entt::entity b, bool applyImpulse);

    /** @brief Impact events emitted by the last update */
    const std::vector<ImpactEvent>& impacts() const { return impactEvents; }

private:
    std::vector<ImpactEvent> impactEvents;
};

} // namespace Systems

#endif
