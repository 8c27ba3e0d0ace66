#include "errors.hpp"

namespace mm {

auto KindName(Warning::Kind const k) -> std::string
{
  switch (k) {
  case Warning::Kind::MalformedRecord: return "malformed-record";
  case Warning::Kind::InvalidParameter: return "invalid-parameter";
  case Warning::Kind::InconsistentGeometry: return "inconsistent-geometry";
  case Warning::Kind::DuplicateRecord: return "duplicate-record";
  case Warning::Kind::IrregularGrid: return "irregular-grid";
  case Warning::Kind::DroppedImageType: return "dropped-image-type";
  }
  return "unknown";
}

void Surface(Warning::Kind const k, Log::Failure const &e, Warnings &warnings)
{
  Log::SaveEntry(e.what(), fmt::fg(fmt::terminal_color::bright_yellow), Log::Display::None);
  warnings.push_back(Warning{k, e.what()});
}

MalformedRecordError::MalformedRecordError(
  std::string const &source, Index const l, std::string const &t, Index const found, Index const expected)
  : Log::Failure("PAR", "{} line {} has {} columns, expected {}: '{}'", source, l, found, expected, t)
  , line{l}
  , text{t}
{
}

InvalidParameterError::InvalidParameterError(std::string const &f, Index const r, std::string const &reason)
  : Log::Failure("Model",
                 "Invalid {} in {}: {}",
                 f,
                 r < 0 ? std::string("general information") : fmt::format("record {}", r),
                 reason)
  , field{f}
  , record{r}
{
}

InconsistentGeometryError::InconsistentGeometryError(Index const r, Sz2 const found, Sz2 const expected)
  : Log::Failure("Assemble", "Record {} has resolution {}x{}, expected {}x{}", r, found[0], found[1], expected[0], expected[1])
  , record{r}
{
}

TruncatedDataError::TruncatedDataError(std::string const &source, Index const req, Index const avail)
  : Log::Failure("REC", "{} holds {} bytes but the header declares {}", source, avail, req)
  , required{req}
  , available{avail}
{
}

UnsupportedVersionError::UnsupportedVersionError(std::string const &source, std::string const &v)
  : Log::Failure("PAR",
                 "{} declares unsupported format version '{}'",
                 source,
                 v.empty() ? std::string("none") : v)
  , version{v}
{
}

ExportError::ExportError(std::string const &target, std::string const &cause)
  : Log::Failure("Export", "Could not write {}: {}", target, cause)
{
}

RescaleStateError::RescaleStateError(std::string const &image)
  : Log::Failure("Rescale", "The {} image has already been rescaled", image)
{
}

} // namespace mm
