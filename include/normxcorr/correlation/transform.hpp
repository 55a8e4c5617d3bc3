#pragma once

#include "normxcorr/core/types.hpp"

namespace normxcorr::correlation {

// 2D DFT of a real grid (cv::dft, full complex output, unscaled).
// Throws EmptyInputError for a zero-area grid and TransformError when the
// backend fails.
FrequencyGrid forward_transform(const Matrix2Dd& spatial);

// Inverse of forward_transform, scaled by 1/(W*H), real part only.
// The input must carry the conjugate symmetry of a real signal's spectrum.
Matrix2Dd inverse_transform(const FrequencyGrid& spectrum);

} // namespace normxcorr::correlation
