#include "carrom/core/board_config.hpp"
#include "carrom/core/errors.hpp"

#include <cmath>
#include <string>

namespace {

void requirePositive(double value, const char* name) {
    if (!std::isfinite(value) || value <= 0.0) {
        throw ConfigError(std::string(name) + " must be a positive number");
    }
}

} // namespace

void validateConfig(const MatchConfig& config) {
    if (config.playerCount != 2 && config.playerCount != 4) {
        throw ConfigError("player count must be 2 or 4, got " + std::to_string(config.playerCount));
    }

    const BoardConfig& b = config.board;
    requirePositive(b.boardSize, "boardSize");
    requirePositive(b.pocketRadius, "pocketRadius");
    requirePositive(b.strikerRadius, "strikerRadius");
    requirePositive(b.coinRadius, "coinRadius");
    requirePositive(b.queenRadius, "queenRadius");
    requirePositive(b.maxStrikerSpeed, "maxStrikerSpeed");

    if (!std::isfinite(b.boardOrigin)) {
        throw ConfigError("boardOrigin must be finite");
    }
    if (!(b.friction > 0.0 && b.friction < 1.0)) {
        throw ConfigError("friction must lie in (0, 1)");
    }
    if (!(b.wallRestitution >= 0.0 && b.wallRestitution <= 1.0)) {
        throw ConfigError("wallRestitution must lie in [0, 1]");
    }
    if (!(b.restThreshold >= 0.0) || !(b.captureMargin >= 0.0) || b.captureMargin >= b.pocketRadius) {
        throw ConfigError("restThreshold and captureMargin must be non-negative, captureMargin below pocketRadius");
    }
    if (b.relaxationPasses < 0) {
        throw ConfigError("relaxationPasses must not be negative");
    }

    // The striker needs room to slide along its baseline
    double const usable = b.boardSize - 2.0 * (b.baselineEndInset + b.strikerRadius);
    if (usable < 0.0 || b.baselineInset < b.strikerRadius || 2.0 * b.baselineInset > b.boardSize) {
        throw ConfigError("baseline insets do not fit on the board");
    }
}

Position boardCenter(const BoardConfig& config) {
    double const c = config.boardOrigin + config.boardSize / 2.0;
    return {c, c};
}

std::array<Position, 4> pocketCenters(const BoardConfig& config) {
    double const lo = config.boardOrigin;
    double const hi = config.boardOrigin + config.boardSize;
    return {
        Position(lo, lo),
        Position(hi, lo),
        Position(lo, hi),
        Position(hi, hi)
    };
}
