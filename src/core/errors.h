#pragma once
/**
 * Input errors raised before any optimization work begins.
 *
 * Cancellation is not an error: a cancelled run returns its best-ever
 * result with OptimizationResult::cancelled set.
 */

#include "core/types.h"
#include <stdexcept>
#include <string>

namespace cutstock {

/** Non-positive length or quantity, empty order, or unusable configuration */
class InvalidInputError : public std::invalid_argument {
public:
    explicit InvalidInputError(const std::string& what)
        : std::invalid_argument(what) {}
};

/** A required part is longer than the raw stock: no beam can ever hold it */
class InfeasiblePartError : public std::invalid_argument {
public:
    InfeasiblePartError(Length length, Length raw_length);

    Length length() const { return length_; }
    Length raw_length() const { return raw_length_; }

private:
    Length length_;
    Length raw_length_;
};

} // namespace cutstock
