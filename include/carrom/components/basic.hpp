#ifndef CARROM_COMPONENTS_BASIC_HPP
#define CARROM_COMPONENTS_BASIC_HPP

#include "carrom/math/vector_math.hpp" // for Position, Vector

namespace Components {

    enum class DiscKind {
        RegularLight,
        RegularDark,
        Queen,
        Striker
    };

    // Use the Position and Vector classes from vector_math.hpp
    using Position = ::Position;
    using Velocity = ::Vector;

    struct Radius {
        double value = 1.0;

        explicit Radius(double v = 1.0) : value(v) {}
    };

    // Per-tick velocity multiplier, 0 < coefficient < 1
    struct Friction {
        double coefficient = 0.98;

        explicit Friction(double c = 0.98) : coefficient(c) {}
    };

    // Role tag. The striker always has id 0, coins are numbered from 1
    // in layout order. Iteration that must be deterministic goes by id.
    struct DiscTag {
        int id = 0;
        DiscKind kind = DiscKind::RegularLight;

        DiscTag(int i = 0, DiscKind k = DiscKind::RegularLight) : id(i), kind(k) {}
    };

    // Empty tag: present while the disc sits in a pocket
    struct Captured {};

    const char* kindName(DiscKind kind);

} // namespace Components

#endif
