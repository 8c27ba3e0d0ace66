#pragma once

#include "errors.hpp"
#include "image.hpp"
#include "par/parameters.hpp"
#include "rec.hpp"

#include <map>
#include <optional>

namespace mm {

struct Assembly
{
  std::vector<ImageArray> images; // Ordered by image type code
  Warnings                warnings;
};

/*
 * Ordered map from raw scanner index values to contiguous zero-based positions
 */
struct AxisMap
{
  void insert(Index const raw);
  void freeze();
  auto position(Index const raw) const -> Index;
  auto size() const -> Index;
  auto labels() const -> std::vector<Index>;

private:
  std::map<Index, Index> map_;
};

auto AssembleType(ParameterModel const &model, ImageType const type, RecSource const &rec, Warnings &warnings)
  -> std::optional<ImageArray>;

auto Assemble(ParameterModel const &model, RecSource const &rec) -> Assembly;

} // namespace mm
