#pragma once

#include "normxcorr/core/types.hpp"

namespace normxcorr::correlation {

// Reports the first cell, in row-major order, whose score is within
// `tolerance` of the surface maximum, together with the maximum itself.
// Throws EmptyInputError for an empty surface.
MatchResult find_peak(const CorrelationSurface& surface, double tolerance);

} // namespace normxcorr::correlation
