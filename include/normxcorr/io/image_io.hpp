#pragma once

#include "normxcorr/core/types.hpp"

#include <opencv2/core.hpp>
#include <string>

namespace normxcorr::io {

// Colour to single-channel reduction applied at load time.
enum class ChannelReduction {
    REC709,
    REC601,
    AVERAGE
};

ChannelReduction string_to_channel_reduction(const std::string& s);
std::string channel_reduction_to_string(ChannelReduction reduction);

// Full-scale value implied by an OpenCV depth: 255 for 8-bit, 65535 for
// 16-bit, 1.0 for floating point. Throws IOError for other depths.
float full_scale_for_depth(int depth);

// Converts a decoded 1-4 channel image (BGR order) into a single-channel
// raster. Alpha is dropped.
Raster raster_from_mat(const cv::Mat& image, ChannelReduction reduction);

// Loads FITS via cfitsio and everything else through cv::imread. FITS full
// scale follows the stored image type unless fits_full_scale > 0 overrides it.
Raster load_raster(const fs::path& path, ChannelReduction reduction, float fits_full_scale);

} // namespace normxcorr::io
