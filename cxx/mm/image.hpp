#pragma once

#include "io/hd5-core.hpp"
#include "par/record.hpp"
#include "types.hpp"

#include <array>
#include <string>
#include <vector>

namespace mm {

enum struct Unit
{
  Dimensionless,
  Counts,
  Radians,
  CmPerS
};

auto UnitName(Unit const u) -> std::string;
auto UnitFromName(std::string const &name) -> Unit;

/*
 * One N-dimensional array per image type. Axes are (row, column, slice, echo, dynamic, cardiac_phase).
 * labels[k] holds the acquisition index value at each position along non-spatial axis k.
 */
struct ImageArray
{
  ImageType                         type = ImageType::Magnitude;
  Re6                               data;
  I4                                source; // Record that filled each slab, -1 where none did
  std::array<std::vector<Index>, 4> labels;
  HD5::DNames<6>                    axes = HD5::Dims::Image;
  Unit                              unit = Unit::Dimensionless;
  bool                              rescaled = false;

  auto name() const -> std::string;
  auto filled() const -> Index; // Number of slabs that came from a record
};

} // namespace mm
