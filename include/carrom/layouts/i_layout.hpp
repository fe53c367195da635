#ifndef CARROM_I_LAYOUT_HPP
#define CARROM_I_LAYOUT_HPP

#include <string>
#include <vector>
#include "carrom/components/basic.hpp"
#include "carrom/core/board_config.hpp"

/**
 * @brief Kind and starting centre of one coin
 */
struct DiscPlacement {
    Components::DiscKind kind;
    Components::Position position;
};

/**
 * @brief Abstract base class for an opening arrangement of coins
 *
 * Each layout must provide:
 *  - name() for logs and the driver
 *  - coinPlacements() listing every coin (not the striker). Coins get ids
 *    1..N in the returned order.
 */
class ILayout {
public:
    virtual ~ILayout() = default;

    virtual std::string name() const = 0;

    virtual std::vector<DiscPlacement> coinPlacements(const BoardConfig& config) const = 0;
};

#endif // CARROM_I_LAYOUT_HPP
