#include "normxcorr/correlation/matcher.hpp"
#include "normxcorr/core/errors.hpp"
#include "normxcorr/correlation/correlator.hpp"
#include "normxcorr/correlation/normalizer.hpp"
#include "normxcorr/correlation/padding.hpp"
#include "normxcorr/correlation/peak.hpp"

#include <string>

namespace normxcorr::correlation {

CorrelationSurface correlate(const Raster& tmpl, const Raster& search,
                             const CorrelationOptions& options) {
    const PaddedOperands ops = prepare_operands(tmpl, search, options.padding);
    const CorrelationTerms terms = correlate_terms(ops, options.parallel_terms);
    return normalize_surface(terms, ops, options.stddev_floor);
}

MatchResult find_peak(const CorrelationSurface& surface, const CorrelationOptions& options) {
    return find_peak(surface, options.peak_tolerance);
}

MatchOutput match_template(const Raster& tmpl, const Raster& search,
                           const CorrelationOptions& options) {
    MatchOutput out;
    out.surface = correlate(tmpl, search, options);
    out.match = find_peak(out.surface, options);
    return out;
}

double similarity_score(const Raster& a, const Raster& b, const CorrelationOptions& options) {
    if (a.empty() || b.empty()) {
        throw EmptyInputError("similarity requires two non-empty rasters");
    }
    if (a.width() != b.width() || a.height() != b.height()) {
        throw DimensionError("similarity requires equal sizes, got " +
                             std::to_string(a.width()) + "x" + std::to_string(a.height()) +
                             " and " + std::to_string(b.width()) + "x" +
                             std::to_string(b.height()));
    }
    validate_inputs(a, b);

    const Matrix2Dd da = to_full_scale_units(a);
    const Matrix2Dd db = to_full_scale_units(b);
    const Statistics sa = compute_statistics(da);
    const Statistics sb = compute_statistics(db);

    const double n = static_cast<double>(da.size());
    const double covariance =
        ((da.array() - sa.mean) * (db.array() - sb.mean)).sum() / n;

    if (sa.stddev < options.stddev_floor || sb.stddev < options.stddev_floor) {
        return covariance;
    }
    return covariance / (sa.stddev * sb.stddev);
}

} // namespace normxcorr::correlation
