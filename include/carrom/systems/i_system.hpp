/**
 * @file i_system.hpp
 * @brief Interface for all ECS systems acting on the board
 */

#pragma once

#include <vector>
#include <entt/entt.hpp>
#include "carrom/core/board_config.hpp"

namespace Systems {

/**
 * @brief Discs a system should visit, in visiting order.
 *
 * Order is significant for collisions and capture reporting, so systems
 * never rely on registry view order. PhysicsWorld keeps these lists sorted
 * by disc id, striker first.
 */
using DiscList = std::vector<entt::entity>;

/**
 * @class ISystem
 * @brief Base interface for all ECS systems
 *
 * Every system is configured from the shared BoardConfig and then stepped
 * over an explicit list of discs.
 */
class ISystem {
public:
    virtual ~ISystem() = default;

    /**
     * @brief Runs the system once over the given discs
     *
     * @param registry EnTT registry containing all discs
     * @param discs Discs to process, in order. Captured discs are skipped.
     */
    virtual void update(entt::registry& registry, const DiscList& discs) = 0;

    /**
     * @brief Sets the board configuration
     *
     * @param config Board configuration parameters
     */
    virtual void setBoardConfig(const BoardConfig& config) = 0;
};

/**
 * @class ConfigurableSystem
 * @brief ISystem carrying a system-specific config derived from BoardConfig
 *
 * TConfig must provide `static TConfig fromBoard(const BoardConfig&)`.
 * Setting the board config rebuilds the specific config; tests may then
 * override individual fields through setSpecificConfig.
 */
template <typename TConfig>
class ConfigurableSystem : public ISystem {
public:
    void setBoardConfig(const BoardConfig& config) override {
        boardConfig = config;
        specificConfig = TConfig::fromBoard(config);
    }

    void setSpecificConfig(const TConfig& config) {
        specificConfig = config;
    }

    const TConfig& getSpecificConfig() const {
        return specificConfig;
    }

protected:
    BoardConfig boardConfig;
    TConfig specificConfig = TConfig::fromBoard(BoardConfig{});
};

} // namespace Systems
