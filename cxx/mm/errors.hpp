#pragma once

#include "log/log.hpp"
#include "types.hpp"

#include <string>
#include <vector>

namespace mm {

/*
 * A recoverable error that was caught at a component boundary. The affected row, record or
 * image type was left out of the result.
 */
struct Warning
{
  enum struct Kind
  {
    MalformedRecord,
    InvalidParameter,
    InconsistentGeometry,
    DuplicateRecord,
    IrregularGrid,
    DroppedImageType
  };

  Kind        kind;
  std::string message;
};

using Warnings = std::vector<Warning>;

auto KindName(Warning::Kind const k) -> std::string;

// Record the warning and echo it to the log
void Surface(Warning::Kind const k, Log::Failure const &e, Warnings &warnings);

// Recoverable
struct MalformedRecordError : Log::Failure
{
  MalformedRecordError(std::string const &source, Index const line, std::string const &text, Index const found, Index const expected);
  Index       line;
  std::string text;
};

struct InvalidParameterError : Log::Failure
{
  InvalidParameterError(std::string const &field, Index const record, std::string const &reason);
  std::string field;
  Index       record; // -1 for scan-level entries
};

struct InconsistentGeometryError : Log::Failure
{
  InconsistentGeometryError(Index const record, Sz2 const found, Sz2 const expected);
  Index record;
};

// Fatal
struct TruncatedDataError : Log::Failure
{
  TruncatedDataError(std::string const &source, Index const required, Index const available);
  Index required, available;
};

struct UnsupportedVersionError : Log::Failure
{
  UnsupportedVersionError(std::string const &source, std::string const &version);
  std::string version;
};

struct ExportError : Log::Failure
{
  ExportError(std::string const &target, std::string const &cause);
};

struct RescaleStateError : Log::Failure
{
  RescaleStateError(std::string const &image);
};

} // namespace mm
