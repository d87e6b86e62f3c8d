#pragma once

#include "nrt_predict/core/types.hpp"

#include <vector>

namespace nrt_predict::image {

// Nearest-neighbour resize to width x height, sampling at pixel centres
Matrix2Df resample_nearest(const Matrix2Df& band, int width, int height);

// Resize every band; bands already at the target size are left untouched
void resample_raster(Raster& raster, int width, int height);

// Replace exact matches of `nodata` with NaN, returns the number replaced
size_t replace_nodata_with_nan(Matrix2Df& band, float nodata);

// Multiply every band by `factor` and set pixels with mask == NODATA to NaN
void scale_and_mask(Raster& raster, double factor, const MaskMatrix& mask);

// Fraction of mask pixels equal to `cls`
double class_fraction(const MaskMatrix& mask, MaskClass cls);

} // namespace nrt_predict::image
