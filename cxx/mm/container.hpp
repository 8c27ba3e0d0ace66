#pragma once

#include "image.hpp"
#include "par/parameters.hpp"

#include <filesystem>

namespace mm {

/*
 * Writes the scan parameters, record table, one group per image type and the saved log to an HDF5
 * container. The file only appears at target once every group has been written.
 */
void Export(std::filesystem::path const &target, ParameterModel const &model, std::vector<ImageArray> const &images);

auto Import(std::filesystem::path const &path) -> std::vector<ImageArray>;
auto ImportRecords(std::filesystem::path const &path) -> std::vector<ParameterRecord>;

} // namespace mm
