#pragma once

#include "image.hpp"

namespace mm {

/*
 * Crops the row, column and slice axes to the bounding box of the finite non-zero samples. Slice
 * labels and the record map follow the crop. Arrays without such samples are returned unchanged.
 */
auto CropToSupport(ImageArray const &img) -> ImageArray;

} // namespace mm
