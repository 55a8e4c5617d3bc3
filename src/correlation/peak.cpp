#include "normxcorr/correlation/peak.hpp"
#include "normxcorr/core/errors.hpp"

#include <limits>
#include <vector>

namespace normxcorr::correlation {

MatchResult find_peak(const CorrelationSurface& surface, double tolerance) {
    if (surface.empty()) {
        throw EmptyInputError("correlation surface has zero area");
    }

    const Matrix2Dd& s = surface.scores();
    const int rows = surface.rows();
    const int cols = surface.cols();
    const double lowest = -std::numeric_limits<double>::infinity();

    std::vector<double> row_max(static_cast<size_t>(rows), lowest);

    #pragma omp parallel for schedule(static)
    for (int y = 0; y < rows; ++y) {
        double m = lowest;
        for (int x = 0; x < cols; ++x) {
            if (s(y, x) > m) m = s(y, x);
        }
        row_max[static_cast<size_t>(y)] = m;
    }

    double max_score = lowest;
    for (double m : row_max) {
        if (m > max_score) max_score = m;
    }

    MatchResult result;
    result.score = max_score;

    const double threshold = max_score - tolerance;
    for (int y = 0; y < rows; ++y) {
        if (row_max[static_cast<size_t>(y)] < threshold) continue;
        for (int x = 0; x < cols; ++x) {
            if (s(y, x) >= threshold) {
                result.row = y;
                result.col = x;
                return result;
            }
        }
    }

    // Only reachable when every cell is NaN.
    throw EmptyInputError("correlation surface holds no finite score");
}

} // namespace normxcorr::correlation
