#pragma once

#include "../types.hpp"

#include <string>

namespace mm {

enum struct ImageType : Index
{
  Magnitude = 0,
  Real = 1,
  Imaginary = 2,
  Phase = 3
};

auto ImageTypeName(ImageType const t) -> std::string;
auto ImageTypeFromName(std::string const &name) -> ImageType;
auto ImageTypeFromCode(Index const code) -> ImageType;

/*
 * One row of the image information table, in canonical units (mm, s, degrees).
 * Plain data so it can be written directly as an HDF5 compound.
 */
struct ParameterRecord
{
  Index     record = 0; // Position among the well-formed rows of the header
  Index     slice = 0, echo = 0, dynamic = 0, phase = 0;
  ImageType type = ImageType::Magnitude;
  Index     sequence = 0;
  Index     indexInRec = 0;
  Index     bits = 16;
  Index     scanPercentage = 100;
  Index     rows = 0, cols = 0; // Recon resolution is (x, y) = (cols, rows)
  float     rescaleIntercept = 0.f;
  float     rescaleSlope = 1.f;
  float     scaleSlope = 1.f;
  float     windowCenter = 0.f, windowWidth = 0.f;

  Eigen::Array3f angulation = Eigen::Array3f::Zero(); // ap, fh, rl
  Eigen::Array3f offcentre = Eigen::Array3f::Zero();  // ap, fh, rl
  float          sliceThickness = 0.f, sliceGap = 0.f;
  Index          displayOrientation = 0, sliceOrientation = 0, fmriStatus = 0, edEs = 0;
  Eigen::Array2f spacing = Eigen::Array2f::Ones(); // x, y
  float          echoTime = 0.f, dynamicTime = 0.f, triggerTime = 0.f;
  float          bFactor = 0.f;
  Index          averages = 1;
  float          flipAngle = 0.f;
  Index          cardiacFrequency = 0, minRR = 0, maxRR = 0, turboFactor = 0;
  float          inversionDelay = 0.f;

  // V4.1 onwards
  Index          bValueNumber = 0, gradientNumber = 0, contrastType = 0, anisotropyType = 0;
  Eigen::Array3f diffusion = Eigen::Array3f::Zero();
  // V4.2 onwards
  Index labelType = 0;

  // Location of the slab in the REC file
  Index offset = 0, bytes = 0;
};

} // namespace mm
