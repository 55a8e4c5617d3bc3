#pragma once

#include "normxcorr/core/types.hpp"

#include <opencv2/core.hpp>
#include <array>
#include <string>

namespace normxcorr::render {

enum class StretchMode {
    NONE,
    MINMAX,
    PERCENTILE
};

StretchMode string_to_stretch_mode(const std::string& s);

struct RenderOptions {
    bool clamp_negative = true;
    StretchMode stretch = StretchMode::NONE;
    double stretch_low_percentile = 1.0;
    double stretch_high_percentile = 99.0;
    int depth = 8;                          // 8 | 16
    std::array<int, 3> box_color{255, 0, 0}; // RGB
    int box_thickness = 1;
    double overlay_opacity = 0.5;
};

/**
 * Maps a copy of the surface to display values in [0,1].
 *
 * With clamp_negative, negative scores become 0 (lossy); otherwise the signed
 * range [-1,1] is mapped linearly onto [0,1]. A stretch, when requested, is
 * applied afterwards on the mapped values.
 */
Matrix2Dd to_display(const CorrelationSurface& surface, const RenderOptions& options);

// [0,1] display values to CV_8U or CV_16U.
cv::Mat encode_display(const Matrix2Dd& display, int depth);

// Grey raster to an 8-bit BGR image for annotation.
cv::Mat raster_to_bgr8(const Raster& raster);

// Search image with a rectangle around the template footprint at the match.
cv::Mat draw_match_box(const Raster& search, const MatchResult& match,
                       int template_width, int template_height,
                       const RenderOptions& options);

// Search image with the template alpha-blended over the matched region.
cv::Mat overlay_template(const Raster& search, const Raster& tmpl,
                         const MatchResult& match, const RenderOptions& options);

// Throws IOError when encoding fails.
void write_image(const fs::path& path, const cv::Mat& image);

// "Match Coords: (col,row) And Score In Range 0 to 1: (score)"
std::string format_match_line(const MatchResult& match);

} // namespace normxcorr::render
