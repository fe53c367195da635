/**
 * @file standard_layout.cpp
 * @brief Concentric-ring opening arrangement
 */

#include <cmath>

#include "carrom/core/constants.hpp"
#include "carrom/layouts/standard_layout.hpp"

namespace {

/**
 * @brief Appends one ring of alternating coins
 * @param out Placement list to extend
 * @param center Board centre
 * @param count Number of coins on the ring
 * @param radius Ring radius
 * @param angleOffset Rotation of the first coin
 * @param evenKind Kind of coins at even indices; odd indices get the other colour
 */
void addRing(std::vector<DiscPlacement>& out,
             const Position& center,
             int count,
             double radius,
             double angleOffset,
             Components::DiscKind evenKind) {
    using Components::DiscKind;
    DiscKind const oddKind = (evenKind == DiscKind::RegularDark) ? DiscKind::RegularLight
                                                                 : DiscKind::RegularDark;
    for (int i = 0; i < count; ++i) {
        double const angle = i * 2.0 * CarromConstants::Pi / count + angleOffset;
        Position const p(center.x + radius * std::cos(angle),
                         center.y + radius * std::sin(angle));
        out.push_back({(i % 2 == 0) ? evenKind : oddKind, p});
    }
}

} // namespace

std::vector<DiscPlacement> StandardLayout::coinPlacements(const BoardConfig& config) const {
    using Components::DiscKind;

    std::vector<DiscPlacement> placements;
    Position const center = boardCenter(config);
    double const r = config.coinRadius;

    placements.push_back({DiscKind::Queen, center});

    addRing(placements, center, layoutConfig.innerCount, r * layoutConfig.innerRadiusFactor,
            0.0, DiscKind::RegularDark);
    addRing(placements, center, layoutConfig.middleCount, r * layoutConfig.middleRadiusFactor,
            CarromConstants::Pi / 8.0, DiscKind::RegularLight);
    addRing(placements, center, layoutConfig.outerCount, r * layoutConfig.outerRadiusFactor,
            CarromConstants::Pi / 9.0, DiscKind::RegularDark);

    return placements;
}
