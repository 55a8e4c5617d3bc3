#include "normxcorr/render/presentation.hpp"
#include "normxcorr/core/errors.hpp"
#include "normxcorr/core/utils.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cstring>
#include <sstream>
#include <vector>

namespace normxcorr::render {

StretchMode string_to_stretch_mode(const std::string& s) {
    const std::string norm = core::to_lower(s);
    if (norm == "none") return StretchMode::NONE;
    if (norm == "minmax") return StretchMode::MINMAX;
    if (norm == "percentile") return StretchMode::PERCENTILE;
    throw ValidationError("unknown stretch mode '" + s + "'");
}

static void stretch_linear(Matrix2Dd& m, double lo, double hi) {
    if (!(hi > lo)) {
        m.setZero();
        return;
    }
    m = ((m.array() - lo) / (hi - lo)).max(0.0).min(1.0).matrix();
}

Matrix2Dd to_display(const CorrelationSurface& surface, const RenderOptions& options) {
    Matrix2Dd out = surface.scores();
    if (out.size() == 0) {
        return out;
    }

    if (options.clamp_negative) {
        out = out.array().max(0.0).min(1.0).matrix();
    } else {
        out = ((out.array() + 1.0) * 0.5).max(0.0).min(1.0).matrix();
    }

    switch (options.stretch) {
        case StretchMode::MINMAX:
            stretch_linear(out, out.minCoeff(), out.maxCoeff());
            break;
        case StretchMode::PERCENTILE: {
            std::vector<double> vals(out.data(), out.data() + out.size());
            const double lo = core::compute_percentile(vals, options.stretch_low_percentile);
            const double hi = core::compute_percentile(vals, options.stretch_high_percentile);
            stretch_linear(out, lo, hi);
            break;
        }
        case StretchMode::NONE:
        default:
            break;
    }
    return out;
}

cv::Mat encode_display(const Matrix2Dd& display, int depth) {
    if (depth != 8 && depth != 16) {
        throw ValidationError("display depth must be 8 or 16");
    }
    cv::Mat src(static_cast<int>(display.rows()), static_cast<int>(display.cols()), CV_64F,
                const_cast<double*>(display.data()));
    cv::Mat out;
    if (depth == 8) {
        src.convertTo(out, CV_8U, 255.0);
    } else {
        src.convertTo(out, CV_16U, 65535.0);
    }
    return out;
}

cv::Mat raster_to_bgr8(const Raster& raster) {
    cv::Mat f(raster.height(), raster.width(), CV_32F, const_cast<float*>(raster.pixels.data()));
    cv::Mat gray;
    f.convertTo(gray, CV_8U, 255.0 / static_cast<double>(raster.full_scale));
    cv::Mat bgr;
    cv::cvtColor(gray, bgr, cv::COLOR_GRAY2BGR);
    return bgr;
}

static cv::Scalar to_bgr_scalar(const std::array<int, 3>& rgb) {
    return cv::Scalar(rgb[2], rgb[1], rgb[0]);
}

cv::Mat draw_match_box(const Raster& search, const MatchResult& match,
                       int template_width, int template_height,
                       const RenderOptions& options) {
    cv::Mat canvas = raster_to_bgr8(search);
    // cv::rectangle takes the inclusive bottom-right corner.
    const cv::Point tl(match.col, match.row);
    const cv::Point br(match.col + template_width - 1, match.row + template_height - 1);
    cv::rectangle(canvas, tl, br, to_bgr_scalar(options.box_color),
                  std::max(1, options.box_thickness));
    return canvas;
}

cv::Mat overlay_template(const Raster& search, const Raster& tmpl,
                         const MatchResult& match, const RenderOptions& options) {
    cv::Mat canvas = raster_to_bgr8(search);
    cv::Mat patch = raster_to_bgr8(tmpl);

    // Clip to the search bounds: matches near the right or bottom edge wrap
    // through the padded canvas.
    const int w = std::min(patch.cols, canvas.cols - match.col);
    const int h = std::min(patch.rows, canvas.rows - match.row);
    if (w <= 0 || h <= 0) {
        return canvas;
    }

    const double alpha = std::min(std::max(options.overlay_opacity, 0.0), 1.0);
    cv::Mat roi = canvas(cv::Rect(match.col, match.row, w, h));
    cv::Mat blended;
    cv::addWeighted(patch(cv::Rect(0, 0, w, h)), alpha, roi, 1.0 - alpha, 0.0, blended);
    blended.copyTo(roi);
    return canvas;
}

void write_image(const fs::path& path, const cv::Mat& image) {
    bool ok = false;
    try {
        ok = cv::imwrite(path.string(), image);
    } catch (const cv::Exception& e) {
        throw IOError("Cannot write image " + path.string() + ": " + e.what());
    }
    if (!ok) {
        throw IOError("Cannot write image: " + path.string());
    }
}

std::string format_match_line(const MatchResult& match) {
    std::ostringstream oss;
    oss << "Match Coords: (" << match.col << "," << match.row
        << ") And Score In Range 0 to 1: (" << match.score << ")";
    return oss.str();
}

} // namespace normxcorr::render
