#pragma once

#include "normxcorr/core/types.hpp"
#include "normxcorr/correlation/correlator.hpp"
#include "normxcorr/correlation/padding.hpp"

namespace normxcorr::correlation {

/**
 * Combines the raw cross terms into normalised scores on the padded canvas.
 *
 *   var(y,x)   = B/N - (C/N)^2
 *   denom(y,x) = std(T) * sqrt(var)
 *   score(y,x) = (A/N) / denom
 *
 * N is the template area. When either std(T) or sqrt(var) falls below
 * stddev_floor (fraction of full scale) the denominator is taken as 1, which
 * flattens near-constant regions to their (near-zero) covariance instead of
 * dividing by zero.
 */
Matrix2Dd normalize_terms(const CorrelationTerms& terms, const Statistics& template_stats,
                          double template_area, double stddev_floor);

// Discards the padded border: keeps the top-left search_height x search_width block.
CorrelationSurface crop_surface(const Matrix2Dd& padded_scores, int search_width,
                                int search_height);

// normalize_terms followed by crop_surface.
CorrelationSurface normalize_surface(const CorrelationTerms& terms, const PaddedOperands& ops,
                                     double stddev_floor);

} // namespace normxcorr::correlation
