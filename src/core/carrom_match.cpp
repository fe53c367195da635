/**
 * @file carrom_match.cpp
 * @brief Implementation of CarromMatch.
 */

#include "carrom/core/carrom_match.hpp"

#include <cmath>
#include <string>
#include <utility>

#include "carrom/core/constants.hpp"
#include "carrom/core/debug.hpp"
#include "carrom/core/errors.hpp"
#include "carrom/core/profile.hpp"
#include "carrom/layouts/standard_layout.hpp"

CarromMatch::CarromMatch(const MatchConfig& config)
    : CarromMatch(config, std::make_unique<StandardLayout>()) {}

CarromMatch::CarromMatch(const MatchConfig& config, std::unique_ptr<ILayout> layout)
    : config(config), layout(std::move(layout)) {
    validateConfig(this->config);
    if (!this->layout) {
        throw ConfigError("a match needs a layout");
    }
    reset();
}

CarromMatch::~CarromMatch() = default;

void CarromMatch::reset() {
    auto freshWorld = std::make_unique<PhysicsWorld>(config.board);
    freshWorld->loadLayout(*layout, seatOf(1, config.playerCount));
    auto freshRules = std::make_unique<RuleEngine>(config, *freshWorld);

    world = std::move(freshWorld);
    rules = std::move(freshRules);
    shot.clear();
}

std::vector<DiscPosition> CarromMatch::positions() const {
    std::vector<DiscPosition> out;
    for (const auto& disc : world->discStates()) {
        if (!disc.captured) {
            out.push_back({disc.id, disc.position.x, disc.position.y});
        }
    }
    return out;
}

TickResult CarromMatch::advanceTick() {
    PROFILE_SCOPE("CarromMatch::advanceTick");

    TickResult result;

    if (rules->phase() == Phase::ShotInFlight) {
        StepReport report = world->tick(shot);
        result.captures = std::move(report.captured);
        result.impacts = std::move(report.impacts);
        result.atRest = report.atRest;

        if (report.atRest) {
            result.outcome = rules->resolveShot(shot);
            shot.clear();
        }
    }

    result.positions = positions();
    return result;
}

void CarromMatch::placeStriker(double offset) {
    if (!std::isfinite(offset)) {
        throw InvalidShotParameters("striker offset must be finite");
    }
    if (rules->phase() != Phase::AwaitingShot) {
        throw InvalidShotParameters(std::string("cannot place the striker while ") +
                                    phaseName(rules->phase()));
    }

    const MatchState& state = rules->getState();
    world->placeStriker(seatOf(state.currentPlayer, state.playerCount), offset);
}

void CarromMatch::beginShot(double angle, double power) {
    if (!std::isfinite(angle) || !std::isfinite(power)) {
        throw InvalidShotParameters("shot angle and power must be finite");
    }
    if (power < 0.0 || power > 1.0) {
        throw InvalidShotParameters("shot power " + std::to_string(power) + " outside [0, 1]");
    }
    if (rules->phase() != Phase::AwaitingShot) {
        throw InvalidShotParameters(std::string("cannot shoot while ") + phaseName(rules->phase()));
    }

    if (power == 0.0) {
        return;
    }

    rules->onShotReleased();
    shot.clear();
    world->launchStriker(Vector::fromAngle(angle) * (power * config.board.maxStrikerSpeed));

    CARROM_DEBUG_MSG(CARROM_DEBUG_LEVEL_BASIC,
        "player " << rules->currentPlayer() << " shoots, angle=" << angle << " power=" << power << "\n");
}

TurnOutcome CarromMatch::resolveShot(const ShotRecord& record) {
    TurnOutcome outcome = rules->resolveShot(record);
    shot.clear();
    return outcome;
}

MatchSnapshot CarromMatch::snapshot() const {
    Phase const current = rules->phase();
    if (current != Phase::AwaitingShot && current != Phase::GameOver) {
        throw RulesError(std::string("cannot snapshot while ") + phaseName(current));
    }

    MatchSnapshot snap;
    snap.version = CarromConstants::SnapshotVersion;
    snap.playerCount = config.playerCount;
    snap.state = rules->getState();
    for (const auto& disc : world->discStates()) {
        snap.discs.push_back({disc.id, disc.kind, disc.position, disc.captured});
    }
    return snap;
}

void CarromMatch::restore(const MatchSnapshot& snapshot) {
    validateSnapshot(snapshot);

    MatchConfig restoredConfig = config;
    restoredConfig.playerCount = snapshot.playerCount;

    std::vector<DiscState> discs;
    discs.reserve(snapshot.discs.size());
    for (const auto& record : snapshot.discs) {
        DiscState state;
        state.id = record.id;
        state.kind = record.kind;
        state.position = record.position;
        state.captured = record.captured;
        discs.push_back(state);
    }

    // Build everything first; nothing below can throw once the swap starts
    auto restoredWorld = std::make_unique<PhysicsWorld>(restoredConfig.board);
    try {
        restoredWorld->loadDiscs(discs);
    } catch (const CarromError& e) {
        throw CorruptSnapshot(std::string("corrupt snapshot: ") + e.what());
    }
    auto restoredRules = std::make_unique<RuleEngine>(restoredConfig, *restoredWorld, snapshot.state);

    config = restoredConfig;
    world = std::move(restoredWorld);
    rules = std::move(restoredRules);
    shot.clear();
}
