#include "nrt_predict/image/processing.hpp"
#include "nrt_predict/core/errors.hpp"

#include <cmath>
#include <cstring>
#include <limits>
#include <opencv2/imgproc.hpp>

namespace nrt_predict::image {

namespace {

template <typename MatrixT>
MatrixT from_cv(const cv::Mat& m) {
    using Scalar = typename MatrixT::Scalar;
    MatrixT out(m.rows, m.cols);
    if (m.isContinuous()) {
        std::memcpy(out.data(), m.data, static_cast<size_t>(out.size()) * sizeof(Scalar));
    } else {
        for (int r = 0; r < m.rows; ++r) {
            const Scalar* src = m.ptr<Scalar>(r);
            Scalar* dst = out.data() + static_cast<size_t>(r) * static_cast<size_t>(m.cols);
            std::memcpy(dst, src, static_cast<size_t>(m.cols) * sizeof(Scalar));
        }
    }
    return out;
}

void check_target(int width, int height) {
    if (width <= 0 || height <= 0) {
        throw NrtError("resample target must be positive, got " + std::to_string(width) +
                       " x " + std::to_string(height));
    }
}

} // namespace

Matrix2Df resample_nearest(const Matrix2Df& band, int width, int height) {
    check_target(width, height);
    if (band.cols() == width && band.rows() == height) {
        return band;
    }
    if (band.size() == 0) {
        return Matrix2Df::Constant(height, width, std::numeric_limits<float>::quiet_NaN());
    }

    cv::Mat src(static_cast<int>(band.rows()), static_cast<int>(band.cols()), CV_32F,
                const_cast<float*>(band.data()));
    // Pixel-centre sampling, src = floor((dst + 0.5) * ratio), as GDAL RasterIO does
    cv::Mat dst;
    cv::resize(src, dst, cv::Size(width, height), 0.0, 0.0, cv::INTER_NEAREST_EXACT);
    return from_cv<Matrix2Df>(dst);
}

void resample_raster(Raster& raster, int width, int height) {
    for (auto& band : raster.bands) {
        if (band.cols() != width || band.rows() != height) {
            band = resample_nearest(band, width, height);
        }
    }
}

size_t replace_nodata_with_nan(Matrix2Df& band, float nodata) {
    const float nan = std::numeric_limits<float>::quiet_NaN();
    size_t n = 0;
    float* p = band.data();
    const Eigen::Index total = band.size();
    for (Eigen::Index i = 0; i < total; ++i) {
        if (p[i] == nodata) {
            p[i] = nan;
            ++n;
        }
    }
    return n;
}

void scale_and_mask(Raster& raster, double factor, const MaskMatrix& mask) {
    const float nan = std::numeric_limits<float>::quiet_NaN();
    const float f = static_cast<float>(factor);
    for (auto& band : raster.bands) {
        if (band.rows() != mask.rows() || band.cols() != mask.cols()) {
            throw NrtError("band and mask sizes differ");
        }
        band *= f;
        for (Eigen::Index r = 0; r < band.rows(); ++r) {
            for (Eigen::Index c = 0; c < band.cols(); ++c) {
                if (mask(r, c) == static_cast<uint8_t>(MaskClass::NODATA)) {
                    band(r, c) = nan;
                }
            }
        }
    }
}

double class_fraction(const MaskMatrix& mask, MaskClass cls) {
    if (mask.size() == 0) return 0.0;
    const uint8_t v = static_cast<uint8_t>(cls);
    const auto n = (mask.array() == v).count();
    return static_cast<double>(n) / static_cast<double>(mask.size());
}

} // namespace nrt_predict::image
