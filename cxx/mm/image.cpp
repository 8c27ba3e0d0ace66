#include "image.hpp"

#include "log/log.hpp"

namespace mm {

auto UnitName(Unit const u) -> std::string
{
  switch (u) {
  case Unit::Dimensionless: return "dimensionless";
  case Unit::Counts: return "counts";
  case Unit::Radians: return "radians";
  case Unit::CmPerS: return "cm_per_s";
  }
  return "unknown";
}

auto UnitFromName(std::string const &name) -> Unit
{
  if (name == "dimensionless") {
    return Unit::Dimensionless;
  } else if (name == "counts") {
    return Unit::Counts;
  } else if (name == "radians") {
    return Unit::Radians;
  } else if (name == "cm_per_s") {
    return Unit::CmPerS;
  }
  throw Log::Failure("Image", "Unknown unit {}", name);
}

auto ImageArray::name() const -> std::string { return ImageTypeName(type); }

auto ImageArray::filled() const -> Index
{
  Eigen::Tensor<Index, 0> const n = (source >= source.constant(0)).cast<Index>().sum();
  return n();
}

} // namespace mm
