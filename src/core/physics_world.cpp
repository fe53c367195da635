/**
 * @file physics_world.cpp
 * @brief Implementation of PhysicsWorld.
 */

#include "carrom/core/physics_world.hpp"

#include <algorithm>
#include <cmath>
#include <string>

#include "carrom/core/constants.hpp"
#include "carrom/core/debug.hpp"
#include "carrom/core/errors.hpp"
#include "carrom/core/profile.hpp"

PhysicsWorld::PhysicsWorld(const BoardConfig& config)
    : config(config) {
    movement.setBoardConfig(config);
    boundary.setBoardConfig(config);
    collision.setBoardConfig(config);
    pockets.setBoardConfig(config);
}

void PhysicsWorld::clear() {
    registry.clear();
    striker = entt::null;
    strikerList.clear();
    coins.clear();
    allDiscs.clear();
}

double PhysicsWorld::radiusFor(Components::DiscKind kind) const {
    switch (kind) {
        case Components::DiscKind::Striker:
            return config.strikerRadius;
        case Components::DiscKind::Queen:
            return config.queenRadius;
        default:
            return config.coinRadius;
    }
}

entt::entity PhysicsWorld::createDisc(int id, Components::DiscKind kind, const Components::Position& pos) {
    auto entity = registry.create();
    registry.emplace<Components::Position>(entity, pos);
    registry.emplace<Components::Velocity>(entity, 0.0, 0.0);
    registry.emplace<Components::Radius>(entity, radiusFor(kind));
    registry.emplace<Components::Friction>(entity, config.friction);
    registry.emplace<Components::DiscTag>(entity, id, kind);
    return entity;
}

void PhysicsWorld::loadLayout(const ILayout& layout, Seat strikerSeat) {
    clear();

    striker = createDisc(0, Components::DiscKind::Striker, baselineCenter(strikerSeat));
    strikerList.push_back(striker);
    allDiscs.push_back(striker);

    int nextId = 1;
    for (const auto& placement : layout.coinPlacements(config)) {
        if (placement.kind == Components::DiscKind::Striker) {
            throw CarromError("layout '" + layout.name() + "' places a second striker");
        }
        auto entity = createDisc(nextId++, placement.kind, placement.position);
        coins.push_back(entity);
        allDiscs.push_back(entity);
    }

    CARROM_DEBUG_MSG(CARROM_DEBUG_LEVEL_BASIC,
        "loaded layout " << layout.name() << " with " << coins.size() << " coins\n");
}

void PhysicsWorld::loadDiscs(const std::vector<DiscState>& discs) {
    std::vector<DiscState> sorted(discs);
    std::sort(sorted.begin(), sorted.end(),
              [](const DiscState& a, const DiscState& b) { return a.id < b.id; });

    if (sorted.empty() || sorted.front().id != 0 ||
        sorted.front().kind != Components::DiscKind::Striker) {
        throw CarromError("disc list has no striker with id 0");
    }

    clear();

    for (const auto& state : sorted) {
        if (state.id != 0 && state.kind == Components::DiscKind::Striker) {
            clear();
            throw CarromError("disc " + std::to_string(state.id) + " is a second striker");
        }

        auto entity = createDisc(state.id, state.kind, state.position);
        registry.get<Components::Velocity>(entity) = state.velocity;
        if (state.captured) {
            registry.emplace<Components::Captured>(entity);
        }

        if (state.id == 0) {
            striker = entity;
            strikerList.push_back(entity);
        } else {
            coins.push_back(entity);
        }
        allDiscs.push_back(entity);
    }
}

StepReport PhysicsWorld::tick(ShotRecord& record) {
    PROFILE_SCOPE("PhysicsWorld::tick");

    StepReport report;

    movement.update(registry, strikerList);
    boundary.update(registry, strikerList);
    pockets.update(registry, strikerList);
    if (!pockets.captured().empty()) {
        record.record(0, Components::DiscKind::Striker);
        report.strikerCaptured = true;
        report.captured.push_back(0);
        report.atRest = atRest();
        return report;
    }

    movement.update(registry, coins);
    boundary.update(registry, coins);
    collision.update(registry, allDiscs);
    pockets.update(registry, coins);

    for (auto entity : pockets.captured()) {
        const auto& tag = registry.get<Components::DiscTag>(entity);
        record.record(tag.id, tag.kind);
        report.captured.push_back(tag.id);
    }

    report.impacts = collision.impacts();
    report.atRest = atRest();
    return report;
}

bool PhysicsWorld::atRest() const {
    for (auto entity : allDiscs) {
        if (registry.any_of<Components::Captured>(entity)) {
            continue;
        }
        if (!registry.get<Components::Velocity>(entity).isZero()) {
            return false;
        }
    }
    return true;
}

void PhysicsWorld::launchStriker(const Components::Velocity& velocity) {
    if (striker == entt::null) {
        throw CarromError("no striker on the board");
    }
    registry.get<Components::Velocity>(striker) = velocity;
}

Components::Position PhysicsWorld::baselineCenter(Seat seat) const {
    double const lo = config.boardOrigin + config.baselineInset;
    double const hi = config.boardOrigin + config.boardSize - config.baselineInset;
    Components::Position const center = boardCenter(config);

    switch (seat) {
        case Seat::Bottom:
            return {center.x, hi};
        case Seat::Top:
            return {center.x, lo};
        case Seat::Right:
            return {hi, center.y};
        case Seat::Left:
            return {lo, center.y};
    }
    return center;
}

double PhysicsWorld::maxStrikerOffset() const {
    return config.boardSize / 2.0 - config.baselineEndInset - config.strikerRadius;
}

void PhysicsWorld::placeStriker(Seat seat, double offset) {
    if (striker == entt::null) {
        throw CarromError("no striker on the board");
    }

    double const limit = maxStrikerOffset();
    double const clamped = std::max(-limit, std::min(limit, offset));

    Components::Position pos = baselineCenter(seat);
    if (seat == Seat::Bottom || seat == Seat::Top) {
        pos.x += clamped;
    } else {
        pos.y += clamped;
    }

    registry.get<Components::Position>(striker) = pos;
    registry.get<Components::Velocity>(striker) = Components::Velocity(0.0, 0.0);
}

void PhysicsWorld::resetStriker(Seat seat) {
    if (striker == entt::null) {
        throw CarromError("no striker on the board");
    }

    registry.remove<Components::Captured>(striker);
    registry.get<Components::Velocity>(striker) = Components::Velocity(0.0, 0.0);
    registry.get<Components::Position>(striker) = baselineCenter(seat);
}

bool PhysicsWorld::overlapsCoin(entt::entity self, const Components::Position& pos, double radius) const {
    for (auto entity : coins) {
        if (entity == self || registry.any_of<Components::Captured>(entity)) {
            continue;
        }
        double const minDist = radius + registry.get<Components::Radius>(entity).value;
        if (pos.dist(registry.get<Components::Position>(entity)) < minDist) {
            return true;
        }
    }
    return false;
}

void PhysicsWorld::returnQueenToCenter() {
    auto it = std::find_if(coins.begin(), coins.end(), [this](entt::entity e) {
        return registry.get<Components::DiscTag>(e).kind == Components::DiscKind::Queen;
    });
    if (it == coins.end()) {
        return;
    }
    entt::entity const queen = *it;

    registry.remove<Components::Captured>(queen);
    registry.get<Components::Velocity>(queen) = Components::Velocity(0.0, 0.0);

    Components::Position const center = boardCenter(config);
    double const radius = registry.get<Components::Radius>(queen).value;
    double const lo = config.boardOrigin + radius;
    double const hi = config.boardOrigin + config.boardSize - radius;

    Components::Position spot = center;
    bool found = !overlapsCoin(queen, center, radius);

    // Rings one queen radius apart, 6 more probes per ring, first probe at angle 0
    for (int ring = 1; !found && ring * radius < config.boardSize / 2.0; ++ring) {
        int const probes = 6 * ring;
        for (int i = 0; i < probes && !found; ++i) {
            double const angle = i * 2.0 * CarromConstants::Pi / probes;
            Components::Position const candidate(center.x + ring * radius * std::cos(angle),
                                                 center.y + ring * radius * std::sin(angle));
            if (candidate.x < lo || candidate.x > hi || candidate.y < lo || candidate.y > hi) {
                continue;
            }
            if (pockets.insidePocket(candidate) || overlapsCoin(queen, candidate, radius)) {
                continue;
            }
            spot = candidate;
            found = true;
        }
    }

    registry.get<Components::Position>(queen) = spot;

    CARROM_DEBUG_MSG(CARROM_DEBUG_LEVEL_BASIC,
        "queen returned to (" << spot.x << ", " << spot.y << ")\n");
}

int PhysicsWorld::remainingCoins(Components::DiscKind kind) const {
    int count = 0;
    for (auto entity : coins) {
        if (registry.any_of<Components::Captured>(entity)) {
            continue;
        }
        if (registry.get<Components::DiscTag>(entity).kind == kind) {
            ++count;
        }
    }
    return count;
}

DiscState PhysicsWorld::stateOf(entt::entity entity) const {
    DiscState state;
    const auto& tag = registry.get<Components::DiscTag>(entity);
    state.id = tag.id;
    state.kind = tag.kind;
    state.position = registry.get<Components::Position>(entity);
    state.velocity = registry.get<Components::Velocity>(entity);
    state.captured = registry.any_of<Components::Captured>(entity);
    return state;
}

std::vector<DiscState> PhysicsWorld::discStates() const {
    std::vector<DiscState> states;
    states.reserve(allDiscs.size());
    for (auto entity : allDiscs) {
        states.push_back(stateOf(entity));
    }
    return states;
}
