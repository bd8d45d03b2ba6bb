#pragma once
/**
 * Layer 0: base types
 *
 * Lengths are plain doubles in the caller's unit (mm, cm, ...).
 * Nothing here depends on any other module.
 */

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace cutstock {

using Length = double;

/** Absolute tolerance when testing whether a part still fits into a beam */
constexpr Length kLengthTolerance = 1e-9;

// =============================================================================
// RequiredPart: one (length, quantity) row of the order
// =============================================================================

struct RequiredPart {
    Length length   = 0.0;
    int    quantity = 0;
};

// =============================================================================
// LengthCount: one entry of the unique-length histogram
// =============================================================================

struct LengthCount {
    Length length = 0.0;
    int    count  = 0;
};

/** True for lengths an integer represents exactly (50.0, not 50.5 or 1e300) */
inline bool is_whole_length(Length v) {
    return std::isfinite(v) && std::floor(v) == v && std::fabs(v) < 9.0e15;
}

/** Short display text for a length (10 significant digits): 50 -> "50", 12.5 -> "12.5" */
inline std::string format_length(Length v) {
    char buf[32];
    snprintf(buf, sizeof(buf), "%.10g", v);
    return std::string(buf);
}

/** Shortest text that parses back to exactly v: 0.1 -> "0.1", 50 -> "50" */
inline std::string format_length_exact(Length v) {
    char buf[32];
    for (int digits = 15; digits <= 17; ++digits) {
        snprintf(buf, sizeof(buf), "%.*g", digits, v);
        if (std::strtod(buf, nullptr) == v) break;
    }
    return std::string(buf);
}

} // namespace cutstock
