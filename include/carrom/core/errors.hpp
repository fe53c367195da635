/**
 * @file errors.hpp
 * @brief Exception types thrown by the simulation core
 *
 * Ordinary game outcomes (fouls, missed shots) are never errors. These are
 * raised only for rejected inputs, unusable snapshots and engine misuse.
 */

#pragma once

#include <stdexcept>
#include <string>

class CarromError : public std::runtime_error {
public:
    explicit CarromError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Shot power outside [0, 1], non-finite aim, or a shot issued while
 *        the match is not waiting for one. State is left unchanged.
 */
class InvalidShotParameters : public CarromError {
public:
    using CarromError::CarromError;
};

/**
 * @brief A snapshot with missing or malformed fields. The match the restore
 *        was attempted on is left untouched.
 */
class CorruptSnapshot : public CarromError {
public:
    using CarromError::CarromError;
};

/**
 * @brief Rule engine driven out of order (e.g. resolving a shot that was
 *        never released).
 */
class RulesError : public CarromError {
public:
    using CarromError::CarromError;
};

class ConfigError : public CarromError {
public:
    using CarromError::CarromError;
};
