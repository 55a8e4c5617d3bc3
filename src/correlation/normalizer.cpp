#include "normxcorr/correlation/normalizer.hpp"
#include "normxcorr/core/errors.hpp"

#include <algorithm>
#include <cmath>

namespace normxcorr::correlation {

Matrix2Dd normalize_terms(const CorrelationTerms& terms, const Statistics& template_stats,
                          double template_area, double stddev_floor) {
    if (!(template_area > 0.0)) {
        throw EmptyInputError("template area must be positive");
    }
    const int rows = static_cast<int>(terms.cross.rows());
    const int cols = static_cast<int>(terms.cross.cols());
    if (terms.energy.rows() != rows || terms.energy.cols() != cols ||
        terms.local_sum.rows() != rows || terms.local_sum.cols() != cols) {
        throw TransformError("correlation terms differ in size");
    }

    const double inv_n = 1.0 / template_area;
    const bool flat_template = template_stats.stddev < stddev_floor;

    Matrix2Dd out(rows, cols);

    #pragma omp parallel for schedule(static)
    for (int y = 0; y < rows; ++y) {
        for (int x = 0; x < cols; ++x) {
            const double covariance = terms.cross(y, x) * inv_n;
            const double local_mean = terms.local_sum(y, x) * inv_n;
            const double variance = terms.energy(y, x) * inv_n - local_mean * local_mean;
            const double local_std = std::sqrt(std::max(variance, 0.0));

            double denom = 1.0;
            if (!flat_template && local_std >= stddev_floor) {
                denom = template_stats.stddev * local_std;
            }
            out(y, x) = covariance / denom;
        }
    }
    return out;
}

CorrelationSurface crop_surface(const Matrix2Dd& padded_scores, int search_width,
                                int search_height) {
    if (search_width <= 0 || search_height <= 0) {
        throw EmptyInputError("crop region has zero area");
    }
    if (search_width > padded_scores.cols() || search_height > padded_scores.rows()) {
        throw DimensionError("crop region exceeds the padded canvas");
    }
    return CorrelationSurface(Matrix2Dd(padded_scores.topLeftCorner(search_height, search_width)));
}

CorrelationSurface normalize_surface(const CorrelationTerms& terms, const PaddedOperands& ops,
                                     double stddev_floor) {
    const Matrix2Dd scores =
        normalize_terms(terms, ops.template_stats, ops.template_area(), stddev_floor);
    return crop_surface(scores, ops.search_width, ops.search_height);
}

} // namespace normxcorr::correlation
