#include "normxcorr/correlation/transform.hpp"
#include "normxcorr/core/errors.hpp"

#include <opencv2/core.hpp>

#include <cstring>
#include <vector>

namespace normxcorr::correlation {

static void copy_from_mat(const cv::Mat& src, Matrix2Dd& dst) {
    dst.resize(src.rows, src.cols);
    if (src.isContinuous()) {
        std::memcpy(dst.data(), src.ptr<double>(),
                    static_cast<size_t>(dst.size()) * sizeof(double));
        return;
    }
    for (int r = 0; r < src.rows; ++r) {
        std::memcpy(dst.data() + static_cast<size_t>(r) * static_cast<size_t>(src.cols),
                    src.ptr<double>(r), static_cast<size_t>(src.cols) * sizeof(double));
    }
}

FrequencyGrid forward_transform(const Matrix2Dd& spatial) {
    if (spatial.size() == 0) {
        throw EmptyInputError("cannot transform a zero-area grid");
    }

    cv::Mat src(static_cast<int>(spatial.rows()), static_cast<int>(spatial.cols()), CV_64F,
                const_cast<double*>(spatial.data()));

    FrequencyGrid grid;
    try {
        cv::Mat F;
        cv::dft(src, F, cv::DFT_COMPLEX_OUTPUT);

        std::vector<cv::Mat> planes(2);
        cv::split(F, planes);
        copy_from_mat(planes[0], grid.re);
        copy_from_mat(planes[1], grid.im);
    } catch (const cv::Exception& e) {
        throw TransformError(std::string("forward dft failed: ") + e.what());
    }
    return grid;
}

Matrix2Dd inverse_transform(const FrequencyGrid& spectrum) {
    if (spectrum.re.size() == 0) {
        throw EmptyInputError("cannot inverse-transform a zero-area grid");
    }
    if (spectrum.re.rows() != spectrum.im.rows() || spectrum.re.cols() != spectrum.im.cols()) {
        throw TransformError("real and imaginary planes differ in size");
    }

    const int rows = spectrum.height();
    const int cols = spectrum.width();

    Matrix2Dd out;
    try {
        std::vector<cv::Mat> planes = {
            cv::Mat(rows, cols, CV_64F, const_cast<double*>(spectrum.re.data())),
            cv::Mat(rows, cols, CV_64F, const_cast<double*>(spectrum.im.data()))
        };
        cv::Mat F;
        cv::merge(planes, F);

        cv::Mat spatial;
        cv::dft(F, spatial, cv::DFT_INVERSE | cv::DFT_SCALE | cv::DFT_REAL_OUTPUT);
        copy_from_mat(spatial, out);
    } catch (const cv::Exception& e) {
        throw TransformError(std::string("inverse dft failed: ") + e.what());
    }
    return out;
}

} // namespace normxcorr::correlation
