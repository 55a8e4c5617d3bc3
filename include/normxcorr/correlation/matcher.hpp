#pragma once

#include "normxcorr/core/types.hpp"

namespace normxcorr::correlation {

struct CorrelationOptions {
    PaddingPolicy padding;
    double stddev_floor = 0.002;           // fraction of full scale
    double peak_tolerance = 1.0 / 65535.0; // one Q16 quantum
    bool parallel_terms = true;
};

struct MatchOutput {
    CorrelationSurface surface;
    MatchResult match;
};

// Validate -> Pad/Stat -> Correlate(x3) -> Normalize -> Crop.
// The returned surface has exactly the search raster's dimensions and keeps
// negative scores.
CorrelationSurface correlate(const Raster& tmpl, const Raster& search,
                             const CorrelationOptions& options = CorrelationOptions());

MatchResult find_peak(const CorrelationSurface& surface,
                      const CorrelationOptions& options = CorrelationOptions());

MatchOutput match_template(const Raster& tmpl, const Raster& search,
                           const CorrelationOptions& options = CorrelationOptions());

// Single NCC score of two equal-sized rasters (the zero-offset case).
double similarity_score(const Raster& a, const Raster& b,
                        const CorrelationOptions& options = CorrelationOptions());

} // namespace normxcorr::correlation
