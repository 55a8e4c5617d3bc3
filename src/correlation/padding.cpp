#include "normxcorr/correlation/padding.hpp"
#include "normxcorr/core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace normxcorr::correlation {

static std::string dims_string(const Raster& r) {
    return std::to_string(r.width()) + "x" + std::to_string(r.height());
}

static int round_up_even(int v) {
    return (v % 2 == 0) ? v : v + 1;
}

void validate_inputs(const Raster& tmpl, const Raster& search) {
    if (tmpl.empty()) {
        throw EmptyInputError("template raster has zero area");
    }
    if (search.empty()) {
        throw EmptyInputError("search raster has zero area");
    }
    if (tmpl.width() > search.width() || tmpl.height() > search.height()) {
        throw DimensionError("template " + dims_string(tmpl) +
                             " does not fit inside search raster " + dims_string(search));
    }
    if (!(tmpl.full_scale > 0.0f) || !(search.full_scale > 0.0f)) {
        throw ValidationError("raster full_scale must be positive");
    }
    // A single NaN or Inf would spread through every transform cell.
    if (!tmpl.pixels.allFinite()) {
        throw ValidationError("template raster holds non-finite samples");
    }
    if (!search.pixels.allFinite()) {
        throw ValidationError("search raster holds non-finite samples");
    }
}

PaddedSize compute_padded_size(int search_width, int search_height,
                               const PaddingPolicy& policy) {
    PaddedSize size{search_width, search_height};
    if (policy.round_to_even) {
        size.width = round_up_even(size.width);
        size.height = round_up_even(size.height);
    }
    if (policy.square && size.width != size.height) {
        const int side = std::max(size.width, size.height);
        size.width = side;
        size.height = side;
    }
    return size;
}

Matrix2Dd to_full_scale_units(const Raster& raster) {
    return raster.pixels.cast<double>() / static_cast<double>(raster.full_scale);
}

Statistics compute_statistics(const Matrix2Dd& data) {
    Statistics s;
    if (data.size() == 0) {
        return s;
    }
    const double n = static_cast<double>(data.size());
    s.mean = data.sum() / n;
    const double var = (data.array() - s.mean).square().sum() / n;
    s.stddev = std::sqrt(std::max(var, 0.0));
    return s;
}

Matrix2Dd pad_constant(const Matrix2Dd& data, const PaddedSize& size, double fill) {
    Matrix2Dd out = Matrix2Dd::Constant(size.height, size.width, fill);
    out.topLeftCorner(data.rows(), data.cols()) = data;
    return out;
}

PaddedOperands prepare_operands(const Raster& tmpl, const Raster& search,
                                const PaddingPolicy& policy) {
    validate_inputs(tmpl, search);

    PaddedOperands ops;
    ops.template_width = tmpl.width();
    ops.template_height = tmpl.height();
    ops.search_width = search.width();
    ops.search_height = search.height();
    ops.size = compute_padded_size(search.width(), search.height(), policy);

    // Both statistics come from the unpadded rasters and are reused unchanged
    // by every later stage.
    const Matrix2Dd l = to_full_scale_units(search);
    const Matrix2Dd t = to_full_scale_units(tmpl);
    ops.search_stats = compute_statistics(l);
    ops.template_stats = compute_statistics(t);

    ops.search = pad_constant(l, ops.size, ops.search_stats.mean);
    ops.search_zero_mean = (ops.search.array() - ops.search_stats.mean).matrix();
    ops.search_squared = ops.search.array().square().matrix();

    const Matrix2Dd t_zero_mean = (t.array() - ops.template_stats.mean).matrix();
    ops.template_zero_mean = pad_constant(t_zero_mean, ops.size, 0.0);

    ops.unit_mask = Matrix2Dd::Zero(ops.size.height, ops.size.width);
    ops.unit_mask.topLeftCorner(ops.template_height, ops.template_width).setOnes();

    return ops;
}

} // namespace normxcorr::correlation
