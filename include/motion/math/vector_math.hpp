/**
 * @file vector_math.hpp
 * @brief 2D point type animated by springs
 *
 * Position satisfies the subtractable capability required of animated
 * values (difference, sum, scaling by a scalar). Coordinates are in view
 * space (pixels).
 */

#ifndef MOTION_VECTOR_MATH_HPP
#define MOTION_VECTOR_MATH_HPP

#include <iosfwd>

/**
 * @brief Compares two doubles for approximate equality
 *
 * @param a First value
 * @param b Second value
 * @param epsilon Maximum allowed difference
 * @return true if |a-b| < epsilon
 */
bool nearlyEqual(double a, double b, double epsilon = 1e-9);

/**
 * @brief A point in view space
 */
class Position {
public:
    double x;  ///< X coordinate
    double y;  ///< Y coordinate

    /** @brief Constructs a Position at (0,0) */
    Position();

    Position(double x, double y);

    Position operator+(const Position& b) const;
    Position operator-(const Position& b) const;
    Position operator*(double scalar) const;
    Position operator/(double scalar) const;

    Position& operator+=(const Position& p);
    Position& operator-=(const Position& p);

    bool operator==(const Position& p) const;
    bool operator!=(const Position& p) const;

    /**
     * @brief Euclidean distance to another position
     */
    double dist(const Position& p) const;

    /**
     * @brief Component-wise approximate equality
     */
    bool nearlyEquals(const Position& p, double epsilon = 1e-9) const;
};

std::ostream& operator<<(std::ostream& os, const Position& p);

#endif // MOTION_VECTOR_MATH_HPP
