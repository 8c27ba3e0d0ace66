#pragma once

#include "../types.hpp"

#include <string>
#include <vector>

namespace mm {
namespace PAR {

struct Column
{
  std::string name;
  Index       width; // Number of whitespace-separated tokens
};

using Schema = std::vector<Column>;

namespace Columns {
std::string const Slice = "slice";
std::string const Echo = "echo";
std::string const Dynamic = "dynamic";
std::string const Phase = "cardiac_phase";
std::string const ImageType = "image_type";
std::string const Sequence = "sequence";
std::string const IndexInRec = "index_in_rec";
std::string const PixelBits = "pixel_bits";
std::string const ScanPercentage = "scan_percentage";
std::string const Resolution = "recon_resolution";
std::string const RescaleIntercept = "rescale_intercept";
std::string const RescaleSlope = "rescale_slope";
std::string const ScaleSlope = "scale_slope";
std::string const WindowCenter = "window_center";
std::string const WindowWidth = "window_width";
std::string const Angulation = "angulation";
std::string const Offcentre = "offcentre";
std::string const SliceThickness = "slice_thickness";
std::string const SliceGap = "slice_gap";
std::string const DisplayOrientation = "display_orientation";
std::string const SliceOrientation = "slice_orientation";
std::string const FmriStatus = "fmri_status";
std::string const EdEs = "image_type_ed_es";
std::string const Spacing = "pixel_spacing";
std::string const EchoTime = "echo_time";
std::string const DynamicTime = "dynamic_time";
std::string const TriggerTime = "trigger_time";
std::string const BFactor = "b_factor";
std::string const Averages = "averages";
std::string const FlipAngle = "flip_angle";
std::string const CardiacFrequency = "cardiac_frequency";
std::string const MinRR = "min_rr";
std::string const MaxRR = "max_rr";
std::string const TurboFactor = "turbo_factor";
std::string const InversionDelay = "inversion_delay";
std::string const BValueNumber = "b_value_number";
std::string const GradientNumber = "gradient_number";
std::string const ContrastType = "contrast_type";
std::string const AnisotropyType = "anisotropy_type";
std::string const Diffusion = "diffusion";
std::string const LabelType = "label_type";
} // namespace Columns

auto IsSupported(std::string const &version) -> bool;
auto SchemaFor(std::string const &version) -> Schema const &; // Throws for unsupported versions
auto Width(Schema const &schema) -> Index;

} // namespace PAR
} // namespace mm
