#include "record.hpp"

#include "../log/log.hpp"

namespace mm {

auto ImageTypeName(ImageType const t) -> std::string
{
  switch (t) {
  case ImageType::Magnitude: return "magnitude";
  case ImageType::Real: return "real";
  case ImageType::Imaginary: return "imaginary";
  case ImageType::Phase: return "phase";
  }
  throw Log::Failure("Record", "Unknown image type {}", static_cast<Index>(t));
}

auto ImageTypeFromName(std::string const &name) -> ImageType
{
  if (name == "magnitude") {
    return ImageType::Magnitude;
  } else if (name == "real") {
    return ImageType::Real;
  } else if (name == "imaginary") {
    return ImageType::Imaginary;
  } else if (name == "phase") {
    return ImageType::Phase;
  }
  throw Log::Failure("Record", "Unknown image type name {}", name);
}

auto ImageTypeFromCode(Index const code) -> ImageType
{
  if (code < 0 || code > 3) { throw Log::Failure("Record", "Unknown image type code {}", code); }
  return static_cast<ImageType>(code);
}

} // namespace mm
