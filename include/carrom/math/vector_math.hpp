/**
 * @file vector_math.hpp
 * @brief 2D vector and position mathematics for the board simulation
 *
 * This file provides the geometric primitives used by the physics systems:
 * - Vector class for velocities, normals and offsets
 * - Position class for disc centres and pocket locations
 * - Dot product, length and normalization helpers
 */

#ifndef CARROM_VECTOR_MATH_HPP
#define CARROM_VECTOR_MATH_HPP

// Forward declarations
class Vector;

/**
 * @brief Constants for floating-point comparisons
 */
constexpr double EPSILON = 1e-9;  ///< Below this length a vector has no usable direction

/**
 * @brief Square root that clamps tiny negative inputs (rounding noise) to zero
 *
 * @param d Input value
 * @return double Square root of max(d, 0)
 */
double safeSqrt(double d);

/**
 * @brief Represents a 2D point on the board
 *
 * Position class is used for absolute locations in board units.
 * Supports basic arithmetic and conversion to/from Vector.
 */
class Position {
public:
    double x;  ///< X coordinate
    double y;  ///< Y coordinate

    /** @brief Constructs a Position at (0,0) */
    Position();

    /**
     * @brief Constructs a Position at specified coordinates
     * @param x X coordinate
     * @param y Y coordinate
     */
    Position(double x, double y);

    Position operator+(const Position& b) const;
    Position operator-(const Position& b) const;
    Position operator*(double scalar) const;

    /**
     * @brief Calculates Euclidean distance to another position
     * @param p Target position
     * @return Distance between positions
     */
    double dist(const Position& p) const;

    Position& operator+=(const Vector& v);
    Position& operator-=(const Vector& v);

    bool operator==(const Position& other) const;
    bool operator!=(const Position& other) const;
};

/**
 * @brief Represents a 2D vector with direction and magnitude
 */
class Vector {
public:
    double x;  ///< X component
    double y;  ///< Y component

    /** @brief Constructs a zero vector (0,0) */
    Vector();

    /**
     * @brief Constructs a vector with given components
     * @param x X component
     * @param y Y component
     */
    Vector(double x, double y);

    /**
     * @brief Constructs a vector from a position
     * @param p Position to convert
     */
    Vector(const Position& p);

    /** @brief Converts Vector to Position */
    operator Position() const;

    /** @brief Returns negation of this vector */
    Vector operator-() const;

    Vector operator+(const Vector& b) const;
    Vector operator-(const Vector& b) const;
    Vector operator*(double scalar) const;
    Vector operator/(double scalar) const;

    /** @brief Returns vector magnitude */
    double length() const;

    /**
     * @brief Calculates dot product with another vector
     * @param v Other vector
     * @return Dot product value
     */
    double dotProduct(const Vector& v) const;

    /**
     * @brief Returns normalized vector (length = 1)
     *
     * A zero-length vector is returned unchanged.
     */
    Vector normalized() const;

    /** @brief True when both components are exactly zero */
    bool isZero() const;

    /**
     * @brief Unit vector pointing along an angle
     * @param radians Angle measured from +x towards +y
     */
    static Vector fromAngle(double radians);

    Vector& operator+=(const Vector& v);
    Vector& operator-=(const Vector& v);
    Vector& operator*=(double scalar);
};

#endif
