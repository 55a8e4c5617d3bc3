#include "normxcorr/io/image_io.hpp"
#include "normxcorr/core/errors.hpp"
#include "normxcorr/core/utils.hpp"
#include "normxcorr/io/fits_io.hpp"

#include <opencv2/imgcodecs.hpp>

#include <array>
#include <cstring>
#include <vector>

namespace normxcorr::io {

ChannelReduction string_to_channel_reduction(const std::string& s) {
    const std::string norm = core::to_lower(s);
    if (norm == "rec709") return ChannelReduction::REC709;
    if (norm == "rec601") return ChannelReduction::REC601;
    if (norm == "average") return ChannelReduction::AVERAGE;
    throw ValidationError("unknown channel reduction '" + s + "'");
}

std::string channel_reduction_to_string(ChannelReduction reduction) {
    switch (reduction) {
        case ChannelReduction::REC709: return "rec709";
        case ChannelReduction::REC601: return "rec601";
        case ChannelReduction::AVERAGE: return "average";
        default: return "unknown";
    }
}

float full_scale_for_depth(int depth) {
    switch (depth) {
        case CV_8U: return 255.0f;
        case CV_16U: return 65535.0f;
        case CV_32F:
        case CV_64F: return 1.0f;
        default:
            throw IOError("unsupported sample depth " + std::to_string(depth));
    }
}

// Weights in B, G, R order to match OpenCV channel layout.
static std::array<float, 3> bgr_weights(ChannelReduction reduction) {
    switch (reduction) {
        case ChannelReduction::REC709: return {0.0722f, 0.7152f, 0.2126f};
        case ChannelReduction::REC601: return {0.114f, 0.587f, 0.299f};
        case ChannelReduction::AVERAGE:
        default: return {1.0f / 3.0f, 1.0f / 3.0f, 1.0f / 3.0f};
    }
}

Raster raster_from_mat(const cv::Mat& image, ChannelReduction reduction) {
    if (image.empty()) {
        throw EmptyInputError("decoded image is empty");
    }
    const int channels = image.channels();
    if (channels < 1 || channels > 4) {
        throw IOError("unsupported channel count " + std::to_string(channels));
    }

    Raster raster;
    raster.full_scale = full_scale_for_depth(image.depth());

    cv::Mat f;
    image.convertTo(f, CV_MAKETYPE(CV_32F, channels));

    std::vector<cv::Mat> planes;
    cv::split(f, planes);

    cv::Mat gray;
    if (channels <= 2) {
        // gray or gray + alpha
        gray = planes[0];
    } else {
        const auto w = bgr_weights(reduction);
        gray = planes[0] * w[0] + planes[1] * w[1] + planes[2] * w[2];
    }

    raster.pixels.resize(gray.rows, gray.cols);
    for (int r = 0; r < gray.rows; ++r) {
        std::memcpy(raster.pixels.data() + static_cast<size_t>(r) * static_cast<size_t>(gray.cols),
                    gray.ptr<float>(r), static_cast<size_t>(gray.cols) * sizeof(float));
    }
    return raster;
}

Raster load_raster(const fs::path& path, ChannelReduction reduction, float fits_full_scale) {
    if (!fs::exists(path)) {
        throw IOError("Input image not found: " + path.string());
    }

    if (is_fits_image_path(path)) {
        auto fits = read_fits_float(path);
        Raster raster;
        raster.pixels = std::move(fits.first);
        if (raster.empty()) {
            throw EmptyInputError("FITS image has zero area: " + path.string());
        }
        raster.full_scale = fits_full_scale > 0.0f
                                ? fits_full_scale
                                : full_scale_for_image_type(fits.second.image_type);
        return raster;
    }

    cv::Mat image = cv::imread(path.string(), cv::IMREAD_UNCHANGED);
    if (image.empty()) {
        throw IOError("Cannot decode image: " + path.string());
    }
    return raster_from_mat(image, reduction);
}

} // namespace normxcorr::io
