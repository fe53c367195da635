/**
 * @file movement.hpp
 * @brief System for friction and position integration of discs
 *
 * This system handles:
 * - Scaling velocity by the disc's friction coefficient
 * - Snapping velocity to exactly zero below the rest threshold
 * - Advancing position by velocity (one tick)
 * - Skipping captured discs
 *
 * Required components:
 * - Position (to modify)
 * - Velocity (to modify)
 * - Friction (to read)
 *
 * Optional components:
 * - Captured (disc is skipped)
 */

#ifndef CARROM_MOVEMENT_SYSTEM_HPP
#define CARROM_MOVEMENT_SYSTEM_HPP

#include <entt/entt.hpp>
#include "carrom/components/basic.hpp"
#include "carrom/systems/i_system.hpp"

namespace Systems {

/**
 * @struct MovementConfig
 * @brief Configuration parameters specific to the movement system
 */
struct MovementConfig {
    // Speed (units/tick) below which a disc is stopped dead
    double restThreshold = 0.1;

    static MovementConfig fromBoard(const BoardConfig& board) {
        MovementConfig cfg;
        cfg.restThreshold = board.restThreshold;
        return cfg;
    }
};

/**
 * @class MovementSystem
 * @brief Applies friction and moves non-captured discs
 *
 * The exact-zero snap is what lets "at rest" be decided by equality:
 * a disc either still moves or has velocity (0, 0).
 */
class MovementSystem : public ConfigurableSystem<MovementConfig> {
public:
    MovementSystem() = default;
    ~MovementSystem() override = default;

    /**
     * @brief Integrates one tick for every listed, non-captured disc
     * @param registry EnTT registry containing the discs
     * @param discs Discs to move
     */
    void update(entt::registry& registry, const DiscList& discs) override;

    /**
     * @brief One tick of friction and motion for a single body
     *
     * @param pos Position, advanced in place
     * @param vel Velocity, damped in place
     * @param friction Per-tick velocity multiplier
     * @param restThreshold Speed below which velocity becomes exactly zero
     */
    static void integrate(Components::Position& pos, Components::Velocity& vel,
                          double friction, double restThreshold);
};

} // namespace Systems

#endif
