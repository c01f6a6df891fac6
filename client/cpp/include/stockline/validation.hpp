#pragma once

#include <string>
#include "errors.hpp"

namespace stockline {
namespace validation {

/**
 * Require that a record exists.
 */
inline void require_exists(bool exists, const std::string& message = "Record does not exist") {
    if (!exists) {
        throw InvalidArgumentError(message);
    }
}

/**
 * Require that a value is positive (greater than zero).
 */
template<typename T>
void require_positive(T value, const std::string& field_name = "value") {
    if (value <= 0) {
        throw InvalidArgumentError(field_name + " must be positive");
    }
}

/**
 * Require that a value is not zero.
 */
template<typename T>
void require_non_zero(T value, const std::string& field_name = "value") {
    if (value == 0) {
        throw InvalidArgumentError(field_name + " must not be zero");
    }
}

/**
 * Require that a value does not exceed a limit.
 */
template<typename T>
void require_at_most(T value, T limit, const std::string& field_name = "value") {
    if (value > limit) {
        throw InvalidArgumentError(field_name + " must be at most " + std::to_string(limit));
    }
}

/**
 * Require that a value is not below a limit.
 */
template<typename T>
void require_at_least(T value, T limit, const std::string& field_name = "value") {
    if (value < limit) {
        throw InvalidArgumentError(field_name + " must be at least " + std::to_string(limit));
    }
}

/**
 * Require that a string is not empty.
 */
inline void require_not_empty(const std::string& value, const std::string& field_name = "value") {
    if (value.empty()) {
        throw InvalidArgumentError(field_name + " must not be empty");
    }
}

} // namespace validation
} // namespace stockline
