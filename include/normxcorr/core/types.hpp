#pragma once

#include <Eigen/Dense>
#include <filesystem>
#include <string>
#include <utility>

namespace normxcorr {

namespace fs = std::filesystem;

// Matrix types
using Matrix2Df = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using Matrix2Dd = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// Single-channel raster. Samples live in [0, full_scale].
struct Raster {
    Matrix2Df pixels;
    float full_scale = 1.0f;

    int width() const { return static_cast<int>(pixels.cols()); }
    int height() const { return static_cast<int>(pixels.rows()); }
    bool empty() const { return pixels.size() == 0; }
};

// Per-raster statistics in full-scale units, population normalisation.
struct Statistics {
    double mean = 0.0;
    double stddev = 0.0;
};

// Working canvas size shared by every frequency-domain grid of one match.
struct PaddedSize {
    int width = 0;
    int height = 0;
};

// Padded-size policy: round up to even, then raise to a square canvas.
struct PaddingPolicy {
    bool round_to_even = true;
    bool square = true;
};

// Transform-domain representation of a padded raster.
struct FrequencyGrid {
    Matrix2Dd re;
    Matrix2Dd im;

    int width() const { return static_cast<int>(re.cols()); }
    int height() const { return static_cast<int>(re.rows()); }
};

// Normalised cross-correlation scores, one per alignment offset, cropped to
// the search raster footprint. Immutable once built.
class CorrelationSurface {
public:
    CorrelationSurface() = default;
    explicit CorrelationSurface(Matrix2Dd scores) : scores_(std::move(scores)) {}

    const Matrix2Dd& scores() const { return scores_; }
    int rows() const { return static_cast<int>(scores_.rows()); }
    int cols() const { return static_cast<int>(scores_.cols()); }
    bool empty() const { return scores_.size() == 0; }
    double at(int row, int col) const { return scores_(row, col); }

private:
    Matrix2Dd scores_;
};

// Best match: top-left offset of the template inside the search raster.
struct MatchResult {
    int row = 0;
    int col = 0;
    double score = 0.0;
};

// Pipeline phase enumeration
enum class Phase {
    VALIDATE = 0,
    PAD_STATS = 1,
    CORRELATE = 2,
    NORMALIZE = 3,
    EXTRACT_PEAK = 4,
    RENDER = 5,
    DONE = 6
};

inline std::string phase_to_string(Phase phase) {
    switch (phase) {
        case Phase::VALIDATE: return "VALIDATE";
        case Phase::PAD_STATS: return "PAD_STATS";
        case Phase::CORRELATE: return "CORRELATE";
        case Phase::NORMALIZE: return "NORMALIZE";
        case Phase::EXTRACT_PEAK: return "EXTRACT_PEAK";
        case Phase::RENDER: return "RENDER";
        case Phase::DONE: return "DONE";
        default: return "UNKNOWN";
    }
}

inline int phase_to_int(Phase phase) {
    return static_cast<int>(phase);
}

} // namespace normxcorr
