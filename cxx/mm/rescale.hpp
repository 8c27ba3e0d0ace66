#pragma once

#include "image.hpp"
#include "par/parameters.hpp"

namespace mm {

// (raw * rescale slope + rescale intercept) / scale slope, where a zero scale slope means 1
auto Physical(float const raw, ParameterRecord const &r) -> float;
auto Velocity(float const phase, float const venc) -> float;
auto UnitFor(ImageType const t, std::optional<float> const venc) -> Unit;

/*
 * Converts stored samples to physical units in place. Throws RescaleStateError if the array has
 * already been rescaled.
 */
void Rescale(ParameterModel const &model, ImageArray &img);
void Rescale(ParameterModel const &model, std::vector<ImageArray> &imgs);

} // namespace mm
