#pragma once

#include "../errors.hpp"
#include "header.hpp"
#include "record.hpp"

#include <map>
#include <optional>

namespace mm {

/*
 * Scan-level metadata from the general information section, in canonical units:
 * lengths in mm, times in s, angles in degrees, velocities in cm/s, field strength in T.
 */
struct ScanParameters
{
  std::string version;
  std::string patientName, examinationName, protocolName, examinationDateTime, seriesType;
  Index       acquisitionNr = 0, reconstructionNr = 0;
  float       scanDuration = 0.f;
  Index       maxCardiacPhases = 1, maxEchoes = 1, maxSlices = 1, maxDynamics = 1, maxMixes = 1;
  std::string patientPosition, preparationDirection, technique, scanMode;
  std::array<Index, 2> scanResolution = {0, 0};
  float                repetitionTime = 0.f;
  std::vector<float>   echoTimes; // Distinct per-record echo times, ordered by echo number
  Eigen::Array3f       fov = Eigen::Array3f::Zero(); // ap, fh, rl
  float                waterFatShift = 0.f;
  Eigen::Array3f       angulationMidslice = Eigen::Array3f::Zero();
  Eigen::Array3f       offcentreMidslice = Eigen::Array3f::Zero();
  Index                flowCompensation = 0, presaturation = 0;
  Eigen::Array3f       phaseEncodingVelocity = Eigen::Array3f::Zero();
  Index                mtc = 0, spir = 0, epiFactor = 0, dynamicScan = 0, diffusion = 0;
  float                diffusionEchoTime = 0.f;
  Index                maxDiffusionValues = 1, maxGradientOrients = 1, numberOfLabelTypes = 0;
  std::optional<float> fieldStrength;

  // Every general information entry verbatim, including ones not recognised above
  std::vector<std::pair<std::string, std::string>> general;

  auto venc() const -> std::optional<float>;
};

/*
 * Number of distinct index values per non-spatial axis, over the records at the image type's
 * common resolution. All zero when the image type has no common resolution.
 */
struct AxisExtents
{
  Index slices = 0, echoes = 0, dynamics = 0, phases = 0;
};

/*
 * Validated, immutable view of one PAR header. Records failing validation are excluded and
 * reported in warnings().
 */
struct ParameterModel
{
  ParameterModel(PAR::RawHeader const &raw);

  auto source() const -> std::string const &;
  auto scan() const -> ScanParameters const &;
  auto records() const -> std::vector<ParameterRecord> const &;
  auto warnings() const -> Warnings const &;

  auto nSlices() const -> Index;
  auto imageTypes() const -> std::vector<ImageType>;
  auto resolution(ImageType const t) const -> std::optional<Sz2>; // (rows, cols) the image type is assembled at
  auto extents(ImageType const t) const -> AxisExtents;
  auto requiredBytes() const -> Index; // Smallest REC size that holds every record
  auto declaredBytes() const -> std::optional<Index>; // Sum of every image row's slab, if all were sized

private:
  std::string                             source_;
  ScanParameters                          scan_;
  std::vector<ParameterRecord>            records_;
  Warnings                                warnings_;
  Index                                   nSlices_ = 0;
  std::map<ImageType, std::optional<Sz2>> resolutions_;
  std::map<ImageType, AxisExtents>        extents_;
  Index                                   requiredBytes_ = 0;
  std::optional<Index>                    declaredBytes_;
};

// The resolution shared by the most records, or nothing if several resolutions tie
auto CommonResolution(std::vector<ParameterRecord> const &records) -> std::optional<Sz2>;

auto ValidateRecord(PAR::RawRow const &row, Index const record) -> ParameterRecord;
auto ValidateScan(PAR::RawHeader const &raw, Warnings &warnings) -> ScanParameters;

} // namespace mm
