#include "core/errors.h"

namespace cutstock {

InfeasiblePartError::InfeasiblePartError(Length length, Length raw_length)
    : std::invalid_argument("required length " + format_length(length)
                            + " exceeds raw stock length " + format_length(raw_length))
    , length_(length)
    , raw_length_(raw_length)
{
}

} // namespace cutstock
