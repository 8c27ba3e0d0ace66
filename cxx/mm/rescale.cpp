#include "rescale.hpp"

#include "errors.hpp"
#include "log/log.hpp"

#include <cmath>
#include <numbers>

namespace mm {

auto Physical(float const raw, ParameterRecord const &r) -> float
{
  float const v = raw * r.rescaleSlope + r.rescaleIntercept;
  return r.scaleSlope == 0.f ? v : v / r.scaleSlope;
}

auto Velocity(float const phase, float const venc) -> float { return phase * venc / std::numbers::pi_v<float>; }

auto UnitFor(ImageType const t, std::optional<float> const venc) -> Unit
{
  switch (t) {
  case ImageType::Magnitude: return Unit::Counts;
  case ImageType::Phase: return venc ? Unit::CmPerS : Unit::Radians;
  case ImageType::Real:
  case ImageType::Imaginary: return Unit::Dimensionless;
  }
  return Unit::Dimensionless;
}

void Rescale(ParameterModel const &model, ImageArray &img)
{
  if (img.rescaled) { throw RescaleStateError(img.name()); }

  std::map<Index, ParameterRecord const *> byRecord;
  for (auto const &r : model.records()) {
    byRecord[r.record] = &r;
  }

  auto const  venc = img.type == ImageType::Phase ? model.scan().venc() : std::nullopt;
  Index const rows = img.data.dimension(0), cols = img.data.dimension(1);
  Sz6 const   ext{rows, cols, 1, 1, 1, 1};
  for (Index ip = 0; ip < img.source.dimension(3); ip++) {
    for (Index id = 0; id < img.source.dimension(2); id++) {
      for (Index ie = 0; ie < img.source.dimension(1); ie++) {
        for (Index is = 0; is < img.source.dimension(0); is++) {
          Index const rec = img.source(is, ie, id, ip);
          if (rec < 0) { continue; }
          auto const r = byRecord.find(rec);
          if (r == byRecord.end()) { throw Log::Failure("Rescale", "Record {} is not in {}", rec, model.source()); }
          auto slab = img.data.slice(Sz6{0, 0, is, ie, id, ip}, ext);
          slab = slab.unaryExpr([rp = r->second, venc](float const x) {
            float const p = Physical(x, *rp);
            return venc ? Velocity(p, *venc) : p;
          });
        }
      }
    }
  }
  img.unit = UnitFor(img.type, venc);
  img.rescaled = true;
  Log::Print("Rescale", "{} images rescaled to {}", img.name(), UnitName(img.unit));
}

void Rescale(ParameterModel const &model, std::vector<ImageArray> &imgs)
{
  for (auto &img : imgs) {
    Rescale(model, img);
  }
}

} // namespace mm
