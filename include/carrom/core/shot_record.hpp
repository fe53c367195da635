#pragma once

#include <algorithm>
#include <vector>
#include "carrom/components/basic.hpp"

/**
 * @struct Capture
 * @brief One disc dropping into a pocket
 */
struct Capture {
    int discId = 0;
    Components::DiscKind kind = Components::DiscKind::RegularLight;
};

/**
 * @struct ShotRecord
 * @brief Captures observed from striker release until every disc is at rest
 *
 * Order matters: a queen followed by an own coin in the same shot is a cover.
 * The striker's own capture is listed as well, so its position in the
 * sequence is known.
 */
struct ShotRecord {
    std::vector<Capture> captures;

    void record(int discId, Components::DiscKind kind) {
        captures.push_back({discId, kind});
    }

    // Read from the list, never stored apart from it
    bool strikerCaptured() const {
        return std::any_of(captures.begin(), captures.end(), [](const Capture& c) {
            return c.kind == Components::DiscKind::Striker;
        });
    }

    bool empty() const { return captures.empty(); }

    void clear() { captures.clear(); }
};
