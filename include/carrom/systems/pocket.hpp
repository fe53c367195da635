/**
 * @file pocket.hpp
 * @brief System detecting discs that fall into a corner pocket
 *
 * A disc is captured once its centre is strictly closer to a pocket centre
 * than (pocket radius - capture margin). The margin means a disc has to
 * drop well into the pocket; grazing the rim at speed is not enough.
 *
 * Required components:
 * - Position (to read)
 * - Velocity (zeroed on capture)
 *
 * Adds component:
 * - Captured
 */

#ifndef CARROM_POCKET_SYSTEM_HPP
#define CARROM_POCKET_SYSTEM_HPP

#include <array>
#include <entt/entt.hpp>
#include "carrom/components/basic.hpp"
#include "carrom/systems/i_system.hpp"

namespace Systems {

/**
 * @struct PocketConfig
 * @brief Configuration parameters specific to the pocket system
 */
struct PocketConfig {
    std::array<Components::Position, 4> pockets;
    double pocketRadius = 30.0;
    double captureMargin = 5.0;

    static PocketConfig fromBoard(const BoardConfig& board) {
        PocketConfig cfg;
        cfg.pockets = pocketCenters(board);
        cfg.pocketRadius = board.pocketRadius;
        cfg.captureMargin = board.captureMargin;
        return cfg;
    }
};

/**
 * @class PocketSystem
 * @brief Marks discs as Captured and reports them in visiting order
 */
class PocketSystem : public ConfigurableSystem<PocketConfig> {
public:
    PocketSystem() = default;
    ~PocketSystem() override = default;

    /**
     * @brief Tests every listed, non-captured disc against the pockets
     *
     * Discs captured by this call are available from captured(), in the
     * order they were listed.
     */
    void update(entt::registry& registry, const DiscList& discs) override;

    /**
     * @brief True if a centre at this position lies inside a capture zone
     */
    bool insidePocket(const Components::Position& pos) const;

    /** @brief Discs captured by the last update */
    const DiscList& captured() const { return capturedDiscs; }

private:
    DiscList capturedDiscs;
};

} // namespace Systems

#endif
