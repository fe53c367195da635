/**
 * @file standard_layout.hpp
 * @brief Declaration of the StandardLayout class
 */

#pragma once

#include "carrom/layouts/i_layout.hpp"

/**
 * @struct StandardLayoutConfig
 * @brief Ring geometry for the standard opening
 *
 * Ring radii are multiples of the coin radius. Each ring alternates
 * colours starting from `firstDark`.
 */
struct StandardLayoutConfig {
    int innerCount = 6;
    double innerRadiusFactor = 2.5;

    int middleCount = 8;
    double middleRadiusFactor = 4.5;

    int outerCount = 9;
    double outerRadiusFactor = 6.5;
};

/**
 * @class StandardLayout
 *
 * Queen at the centre surrounded by three concentric rings of coins:
 * 6 inner (dark first), 8 middle (light first, rotated by pi/8) and 9 outer
 * (dark first, rotated by pi/9). That is 11 light and 12 dark coins.
 */
class StandardLayout : public ILayout {
public:
    StandardLayout() = default;
    ~StandardLayout() override = default;

    std::string name() const override { return "standard"; }

    std::vector<DiscPlacement> coinPlacements(const BoardConfig& config) const override;

private:
    StandardLayoutConfig layoutConfig;
};
