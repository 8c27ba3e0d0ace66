#include "schema.hpp"

#include "../log/log.hpp"

#include <map>

namespace mm {
namespace PAR {

namespace {
Schema const V4{{Columns::Slice, 1},
                {Columns::Echo, 1},
                {Columns::Dynamic, 1},
                {Columns::Phase, 1},
                {Columns::ImageType, 1},
                {Columns::Sequence, 1},
                {Columns::IndexInRec, 1},
                {Columns::PixelBits, 1},
                {Columns::ScanPercentage, 1},
                {Columns::Resolution, 2},
                {Columns::RescaleIntercept, 1},
                {Columns::RescaleSlope, 1},
                {Columns::ScaleSlope, 1},
                {Columns::WindowCenter, 1},
                {Columns::WindowWidth, 1},
                {Columns::Angulation, 3},
                {Columns::Offcentre, 3},
                {Columns::SliceThickness, 1},
                {Columns::SliceGap, 1},
                {Columns::DisplayOrientation, 1},
                {Columns::SliceOrientation, 1},
                {Columns::FmriStatus, 1},
                {Columns::EdEs, 1},
                {Columns::Spacing, 2},
                {Columns::EchoTime, 1},
                {Columns::DynamicTime, 1},
                {Columns::TriggerTime, 1},
                {Columns::BFactor, 1},
                {Columns::Averages, 1},
                {Columns::FlipAngle, 1},
                {Columns::CardiacFrequency, 1},
                {Columns::MinRR, 1},
                {Columns::MaxRR, 1},
                {Columns::TurboFactor, 1},
                {Columns::InversionDelay, 1}};

auto Extend(Schema s, Schema const &extra) -> Schema
{
  s.insert(s.end(), extra.begin(), extra.end());
  return s;
}

Schema const V41 = Extend(V4,
                          {{Columns::BValueNumber, 1},
                           {Columns::GradientNumber, 1},
                           {Columns::ContrastType, 1},
                           {Columns::AnisotropyType, 1},
                           {Columns::Diffusion, 3}});

Schema const V42 = Extend(V41, {{Columns::LabelType, 1}});

std::map<std::string, Schema const *> const schemas{{"V4", &V4}, {"V4.1", &V41}, {"V4.2", &V42}};
} // namespace

auto IsSupported(std::string const &version) -> bool { return schemas.contains(version); }

auto SchemaFor(std::string const &version) -> Schema const &
{
  if (auto const s = schemas.find(version); s != schemas.end()) { return *(s->second); }
  throw Log::Failure("PAR", "No column schema for version {}", version);
}

auto Width(Schema const &schema) -> Index
{
  Index w = 0;
  for (auto const &c : schema) {
    w += c.width;
  }
  return w;
}

} // namespace PAR
} // namespace mm
