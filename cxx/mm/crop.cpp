#include "crop.hpp"

#include "log/log.hpp"

#include <cmath>

namespace mm {

auto CropToSupport(ImageArray const &img) -> ImageArray
{
  auto const &d = img.data;
  Index       lo[3] = {d.dimension(0), d.dimension(1), d.dimension(2)};
  Index       hi[3] = {-1, -1, -1};
  for (Index i5 = 0; i5 < d.dimension(5); i5++) {
    for (Index i4 = 0; i4 < d.dimension(4); i4++) {
      for (Index i3 = 0; i3 < d.dimension(3); i3++) {
        for (Index i2 = 0; i2 < d.dimension(2); i2++) {
          for (Index i1 = 0; i1 < d.dimension(1); i1++) {
            for (Index i0 = 0; i0 < d.dimension(0); i0++) {
              float const v = d(i0, i1, i2, i3, i4, i5);
              if (std::isfinite(v) && v != 0.f) {
                Index const ii[3] = {i0, i1, i2};
                for (Index ia = 0; ia < 3; ia++) {
                  lo[ia] = std::min(lo[ia], ii[ia]);
                  hi[ia] = std::max(hi[ia], ii[ia]);
                }
              }
            }
          }
        }
      }
    }
  }
  if (hi[0] < 0) {
    Log::Print("Crop", "{} images have no non-zero samples, not cropping", img.name());
    return img;
  }

  ImageArray cropped = img;
  Sz6 const  st{lo[0], lo[1], lo[2], 0, 0, 0};
  Sz6 const  sz{hi[0] - lo[0] + 1, hi[1] - lo[1] + 1, hi[2] - lo[2] + 1, d.dimension(3), d.dimension(4), d.dimension(5)};
  cropped.data = d.slice(st, sz);
  Sz4 const sst{lo[2], 0, 0, 0};
  Sz4 const ssz{sz[2], img.source.dimension(1), img.source.dimension(2), img.source.dimension(3)};
  cropped.source = img.source.slice(sst, ssz);
  cropped.labels[0] = std::vector<Index>(img.labels[0].begin() + lo[2], img.labels[0].begin() + hi[2] + 1);
  Log::Print("Crop", "{} images cropped from {} to {}", img.name(), d.dimensions(), cropped.data.dimensions());
  return cropped;
}

} // namespace mm
