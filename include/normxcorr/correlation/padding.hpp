#pragma once

#include "normxcorr/core/types.hpp"

namespace normxcorr::correlation {

/**
 * Operands of the three correlation terms, all on one padded canvas.
 *
 * Samples are expressed in full-scale units (raw sample / full_scale), so the
 * unit mask value is 1.0 and every statistic is comparable across rasters of
 * different bit depth. Template-derived grids sit at the origin corner.
 */
struct PaddedOperands {
    PaddedSize size;
    int template_width = 0;
    int template_height = 0;
    int search_width = 0;
    int search_height = 0;

    Statistics template_stats; // over the unpadded template
    Statistics search_stats;   // over the unpadded search raster

    Matrix2Dd search;             // L, padded with mean(L)
    Matrix2Dd search_zero_mean;   // L - mean(L); zero on the padded border
    Matrix2Dd search_squared;     // L^2
    Matrix2Dd template_zero_mean; // T - mean(T), zero padded
    Matrix2Dd unit_mask;          // 1.0 over the template footprint, zero elsewhere

    double template_area() const {
        return static_cast<double>(template_width) * static_cast<double>(template_height);
    }
};

// Throws EmptyInputError for zero-area rasters, DimensionError when the
// template exceeds the search raster along either axis.
void validate_inputs(const Raster& tmpl, const Raster& search);

PaddedSize compute_padded_size(int search_width, int search_height,
                               const PaddingPolicy& policy);

Matrix2Dd to_full_scale_units(const Raster& raster);

Statistics compute_statistics(const Matrix2Dd& data);

Matrix2Dd pad_constant(const Matrix2Dd& data, const PaddedSize& size, double fill);

PaddedOperands prepare_operands(const Raster& tmpl, const Raster& search,
                                const PaddingPolicy& policy);

} // namespace normxcorr::correlation
