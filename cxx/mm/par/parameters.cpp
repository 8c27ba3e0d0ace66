#include "parameters.hpp"

#include "../log/log.hpp"
#include "schema.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <set>

namespace mm {

namespace {
float const ms = 1.e-3f;

using PAR::Token;
namespace Col = PAR::Columns;

auto AsInt(Token const &t, std::string const &field, Index const record) -> Index
{
  if (auto const i = std::get_if<Index>(&t)) { return *i; }
  if (auto const d = std::get_if<double>(&t); d && std::isfinite(*d) && std::floor(*d) == *d) { return static_cast<Index>(*d); }
  throw InvalidParameterError(field, record, fmt::format("'{}' is not an integer", PAR::ToString(t)));
}

auto AsFloat(Token const &t, std::string const &field, Index const record) -> float
{
  if (auto const i = std::get_if<Index>(&t)) { return static_cast<float>(*i); }
  if (auto const d = std::get_if<double>(&t); d && std::isfinite(*d)) { return static_cast<float>(*d); }
  throw InvalidParameterError(field, record, fmt::format("'{}' is not a finite number", PAR::ToString(t)));
}

auto Tokens(PAR::RawRow const &row, std::string const &col, Index const record) -> std::vector<Token> const &
{
  auto const f = row.fields.find(col);
  if (f == row.fields.end() || f->second.empty()) { throw InvalidParameterError(col, record, "column missing"); }
  return f->second;
}

auto Int(PAR::RawRow const &row, std::string const &col, Index const record) -> Index
{
  return AsInt(Tokens(row, col, record).front(), col, record);
}

auto NonNegative(PAR::RawRow const &row, std::string const &col, Index const record) -> Index
{
  auto const v = Int(row, col, record);
  if (v < 0) { throw InvalidParameterError(col, record, fmt::format("index {} is negative", v)); }
  return v;
}

auto Float(PAR::RawRow const &row, std::string const &col, Index const record) -> float
{
  return AsFloat(Tokens(row, col, record).front(), col, record);
}

template <int N> auto Floats(std::vector<Token> const &tokens, std::string const &field, Index const record)
  -> Eigen::Array<float, N, 1>
{
  if ((Index)tokens.size() != N) {
    throw InvalidParameterError(field, record, fmt::format("expected {} values, found {}", N, tokens.size()));
  }
  Eigen::Array<float, N, 1> a;
  for (Index ii = 0; ii < N; ii++) {
    a[ii] = AsFloat(tokens[ii], field, record);
  }
  return a;
}

template <int N> auto Floats(PAR::RawRow const &row, std::string const &col, Index const record) -> Eigen::Array<float, N, 1>
{
  return Floats<N>(Tokens(row, col, record), col, record);
}

auto Resolution(PAR::RawRow const &row, Index const record) -> Sz2
{
  auto const &t = Tokens(row, Col::Resolution, record);
  if (t.size() != 2) { throw InvalidParameterError(Col::Resolution, record, "expected 2 values"); }
  Index const x = AsInt(t[0], Col::Resolution, record);
  Index const y = AsInt(t[1], Col::Resolution, record);
  if (x < 1 || y < 1) { throw InvalidParameterError(Col::Resolution, record, fmt::format("{}x{} is not positive", x, y)); }
  return Sz2{y, x};
}

auto Bits(PAR::RawRow const &row, Index const record) -> Index
{
  auto const b = Int(row, Col::PixelBits, record);
  if (b != 8 && b != 16 && b != 32) { throw InvalidParameterError(Col::PixelBits, record, fmt::format("{} bit samples", b)); }
  return b;
}

// Bytes the row occupies in the REC file, if its resolution and sample width can be read
auto SlabBytes(PAR::RawRow const &row) -> std::optional<Index>
{
  try {
    auto const &res = Tokens(row, Col::Resolution, -1);
    if (res.size() != 2) { return std::nullopt; }
    Index const x = AsInt(res[0], Col::Resolution, -1);
    Index const y = AsInt(res[1], Col::Resolution, -1);
    Index const b = Int(row, Col::PixelBits, -1);
    if (x < 0 || y < 0 || (b != 8 && b != 16 && b != 32)) { return std::nullopt; }
    return x * y * b / 8;
  } catch (InvalidParameterError const &) {
    return std::nullopt;
  }
}

/*
 * Scan-level entries
 */
auto Text(PAR::GeneralEntry const &e) -> std::string { return e.text; }

auto Int(PAR::GeneralEntry const &e) -> Index
{
  if (e.tokens.empty()) { throw InvalidParameterError(e.key, -1, "no value"); }
  return AsInt(e.tokens.front(), e.key, -1);
}

auto Float(PAR::GeneralEntry const &e) -> float
{
  if (e.tokens.empty()) { throw InvalidParameterError(e.key, -1, "no value"); }
  return AsFloat(e.tokens.front(), e.key, -1);
}

// Factor to seconds from the declared unit, or the PAR native unit if none was declared
auto TimeScale(PAR::GeneralEntry const &e, float const native) -> float
{
  if (e.unit.empty()) {
    return native;
  } else if (e.unit == "ms") {
    return ms;
  } else if (e.unit == "s" || e.unit == "sec") {
    return 1.f;
  } else if (e.unit == "us") {
    return 1.e-6f;
  }
  throw InvalidParameterError(e.key, -1, fmt::format("unrecognised time unit '{}'", e.unit));
}

using Setter = std::function<void(PAR::GeneralEntry const &, ScanParameters &)>;

std::map<std::string, Setter> const setters{
  {"patient name", [](auto const &e, auto &s) { s.patientName = Text(e); }},
  {"examination name", [](auto const &e, auto &s) { s.examinationName = Text(e); }},
  {"protocol name", [](auto const &e, auto &s) { s.protocolName = Text(e); }},
  {"examination date/time", [](auto const &e, auto &s) { s.examinationDateTime = Text(e); }},
  {"series type", [](auto const &e, auto &s) { s.seriesType = Text(e); }},
  {"series data type", [](auto const &e, auto &s) { s.seriesType = Text(e); }},
  {"acquisition nr", [](auto const &e, auto &s) { s.acquisitionNr = Int(e); }},
  {"reconstruction nr", [](auto const &e, auto &s) { s.reconstructionNr = Int(e); }},
  {"scan duration", [](auto const &e, auto &s) { s.scanDuration = Float(e) * TimeScale(e, 1.f); }},
  {"max. number of cardiac phases", [](auto const &e, auto &s) { s.maxCardiacPhases = Int(e); }},
  {"max. number of echoes", [](auto const &e, auto &s) { s.maxEchoes = Int(e); }},
  {"max. number of slices/locations", [](auto const &e, auto &s) { s.maxSlices = Int(e); }},
  {"max. number of dynamics", [](auto const &e, auto &s) { s.maxDynamics = Int(e); }},
  {"max. number of mixes", [](auto const &e, auto &s) { s.maxMixes = Int(e); }},
  {"patient position", [](auto const &e, auto &s) { s.patientPosition = Text(e); }},
  {"preparation direction", [](auto const &e, auto &s) { s.preparationDirection = Text(e); }},
  {"technique", [](auto const &e, auto &s) { s.technique = Text(e); }},
  {"scan resolution",
   [](auto const &e, auto &s) {
     auto const r = Floats<2>(e.tokens, e.key, -1);
     s.scanResolution = {static_cast<Index>(r[0]), static_cast<Index>(r[1])};
   }},
  {"scan mode", [](auto const &e, auto &s) { s.scanMode = Text(e); }},
  {"repetition time", [](auto const &e, auto &s) { s.repetitionTime = Float(e) * TimeScale(e, ms); }},
  {"fov", [](auto const &e, auto &s) { s.fov = Floats<3>(e.tokens, e.key, -1); }},
  {"water fat shift", [](auto const &e, auto &s) { s.waterFatShift = Float(e); }},
  {"angulation midslice", [](auto const &e, auto &s) { s.angulationMidslice = Floats<3>(e.tokens, e.key, -1); }},
  {"off centre midslice", [](auto const &e, auto &s) { s.offcentreMidslice = Floats<3>(e.tokens, e.key, -1); }},
  {"flow compensation", [](auto const &e, auto &s) { s.flowCompensation = Int(e); }},
  {"presaturation", [](auto const &e, auto &s) { s.presaturation = Int(e); }},
  {"phase encoding velocity", [](auto const &e, auto &s) { s.phaseEncodingVelocity = Floats<3>(e.tokens, e.key, -1); }},
  {"mtc", [](auto const &e, auto &s) { s.mtc = Int(e); }},
  {"spir", [](auto const &e, auto &s) { s.spir = Int(e); }},
  {"epi factor", [](auto const &e, auto &s) { s.epiFactor = Int(e); }},
  {"dynamic scan", [](auto const &e, auto &s) { s.dynamicScan = Int(e); }},
  {"diffusion", [](auto const &e, auto &s) { s.diffusion = Int(e); }},
  {"diffusion echo time", [](auto const &e, auto &s) { s.diffusionEchoTime = Float(e) * TimeScale(e, ms); }},
  {"max. number of diffusion values", [](auto const &e, auto &s) { s.maxDiffusionValues = Int(e); }},
  {"max. number of gradient orients", [](auto const &e, auto &s) { s.maxGradientOrients = Int(e); }},
  {"number of label types", [](auto const &e, auto &s) { s.numberOfLabelTypes = Int(e); }},
  {"field strength", [](auto const &e, auto &s) { s.fieldStrength = Float(e); }}};
} // namespace

auto CommonResolution(std::vector<ParameterRecord> const &records) -> std::optional<Sz2>
{
  std::map<std::pair<Index, Index>, Index> counts;
  for (auto const &r : records) {
    counts[{r.rows, r.cols}]++;
  }
  Index                   best = 0, ties = 0;
  std::pair<Index, Index> res;
  for (auto const &kv : counts) {
    if (kv.second > best) {
      best = kv.second;
      res = kv.first;
      ties = 1;
    } else if (kv.second == best) {
      ties++;
    }
  }
  if (best == 0 || ties > 1) { return std::nullopt; }
  return Sz2{res.first, res.second};
}

auto ScanParameters::venc() const -> std::optional<float>
{
  Index      ind;
  auto const mx = phaseEncodingVelocity.abs().maxCoeff(&ind);
  if (mx > 0.f) { return std::abs(phaseEncodingVelocity[ind]); }
  return std::nullopt;
}

auto ValidateRecord(PAR::RawRow const &row, Index const record) -> ParameterRecord
{
  ParameterRecord r;
  r.record = record;
  r.slice = NonNegative(row, Col::Slice, record);
  r.echo = NonNegative(row, Col::Echo, record);
  r.dynamic = NonNegative(row, Col::Dynamic, record);
  r.phase = NonNegative(row, Col::Phase, record);
  auto const code = Int(row, Col::ImageType, record);
  if (code < 0 || code > 3) {
    throw InvalidParameterError(Col::ImageType, record, fmt::format("unsupported image type code {}", code));
  }
  r.type = ImageTypeFromCode(code);
  r.sequence = Int(row, Col::Sequence, record);
  r.indexInRec = NonNegative(row, Col::IndexInRec, record);
  r.bits = Bits(row, record);
  r.scanPercentage = Int(row, Col::ScanPercentage, record);
  auto const res = Resolution(row, record);
  r.rows = res[0];
  r.cols = res[1];
  r.rescaleIntercept = Float(row, Col::RescaleIntercept, record);
  r.rescaleSlope = Float(row, Col::RescaleSlope, record);
  r.scaleSlope = Float(row, Col::ScaleSlope, record);
  r.windowCenter = Float(row, Col::WindowCenter, record);
  r.windowWidth = Float(row, Col::WindowWidth, record);
  r.angulation = Floats<3>(row, Col::Angulation, record);
  r.offcentre = Floats<3>(row, Col::Offcentre, record);
  r.sliceThickness = Float(row, Col::SliceThickness, record);
  r.sliceGap = Float(row, Col::SliceGap, record);
  r.displayOrientation = Int(row, Col::DisplayOrientation, record);
  r.sliceOrientation = Int(row, Col::SliceOrientation, record);
  r.fmriStatus = Int(row, Col::FmriStatus, record);
  r.edEs = Int(row, Col::EdEs, record);
  r.spacing = Floats<2>(row, Col::Spacing, record);
  if ((r.spacing <= 0.f).any()) {
    throw InvalidParameterError(Col::Spacing, record, fmt::format("{}x{} mm is not positive", r.spacing[0], r.spacing[1]));
  }
  r.echoTime = Float(row, Col::EchoTime, record) * ms;
  r.dynamicTime = Float(row, Col::DynamicTime, record);
  r.triggerTime = Float(row, Col::TriggerTime, record) * ms;
  r.bFactor = Float(row, Col::BFactor, record);
  r.averages = Int(row, Col::Averages, record);
  r.flipAngle = Float(row, Col::FlipAngle, record);
  r.cardiacFrequency = Int(row, Col::CardiacFrequency, record);
  r.minRR = Int(row, Col::MinRR, record);
  r.maxRR = Int(row, Col::MaxRR, record);
  r.turboFactor = Int(row, Col::TurboFactor, record);
  r.inversionDelay = Float(row, Col::InversionDelay, record) * ms;
  if (row.fields.contains(Col::BValueNumber)) {
    r.bValueNumber = Int(row, Col::BValueNumber, record);
    r.gradientNumber = Int(row, Col::GradientNumber, record);
    r.contrastType = Int(row, Col::ContrastType, record);
    r.anisotropyType = Int(row, Col::AnisotropyType, record);
    r.diffusion = Floats<3>(row, Col::Diffusion, record);
  }
  if (row.fields.contains(Col::LabelType)) { r.labelType = Int(row, Col::LabelType, record); }
  r.bytes = r.rows * r.cols * r.bits / 8;
  return r;
}

auto ValidateScan(PAR::RawHeader const &raw, Warnings &warnings) -> ScanParameters
{
  ScanParameters s;
  s.version = raw.version;
  for (auto const &e : raw.general) {
    s.general.emplace_back(e.key, e.text);
    if (auto const setter = setters.find(e.name); setter != setters.end()) {
      try {
        setter->second(e, s);
      } catch (InvalidParameterError const &err) {
        Surface(Warning::Kind::InvalidParameter, err, warnings);
      }
    } else {
      Log::Debug("Model", "Keeping unrecognised entry '{}' from line {}", e.key, e.line);
    }
  }
  return s;
}

ParameterModel::ParameterModel(PAR::RawHeader const &raw)
  : source_{raw.source}
  , warnings_{raw.warnings}
{
  auto const t0 = Log::Now();
  scan_ = ValidateScan(raw, warnings_);

  // Slabs follow declared row order, malformed and rejected rows included
  std::optional<Index> offset = 0;
  Index                unsized = 0;
  auto                 advance = [&](PAR::RawRow const &row) {
    if (!offset) { return; }
    if (auto const b = SlabBytes(row)) {
      *offset += *b;
    } else {
      offset.reset();
      unsized = row.line;
    }
  };
  auto skip = raw.skipped.begin();
  for (size_t ii = 0; ii < raw.rows.size(); ii++) {
    Index const record = ii;
    auto const &row = raw.rows[ii];
    for (; skip != raw.skipped.end() && skip->before == record; skip++) {
      advance(skip->partial);
    }
    try {
      auto r = ValidateRecord(row, record);
      if (!offset) {
        throw Log::Failure("Model", "{} line {} has no slab size, so record {} on line {} cannot be located", source_,
                           unsized, record, row.line);
      }
      r.offset = *offset;
      records_.push_back(r);
    } catch (InvalidParameterError const &e) {
      Surface(Warning::Kind::InvalidParameter, e, warnings_);
    }
    advance(row);
  }
  for (; skip != raw.skipped.end(); skip++) {
    advance(skip->partial);
  }
  declaredBytes_ = offset;

  std::set<Index>                                  slices;
  std::map<ImageType, std::vector<ParameterRecord>> byType;
  std::map<Index, float>                           echoTimes;
  for (auto const &r : records_) {
    slices.insert(r.slice);
    byType[r.type].push_back(r);
    echoTimes.emplace(r.echo, r.echoTime);
    requiredBytes_ = std::max(requiredBytes_, r.offset + r.bytes);
  }
  nSlices_ = slices.size();
  // Extents cover only the records an image type is assembled from
  for (auto const &kv : byType) {
    auto const res = CommonResolution(kv.second);
    resolutions_[kv.first] = res;
    std::array<std::set<Index>, 4> axes;
    for (auto const &r : kv.second) {
      if (!res || r.rows != (*res)[0] || r.cols != (*res)[1]) { continue; }
      axes[0].insert(r.slice);
      axes[1].insert(r.echo);
      axes[2].insert(r.dynamic);
      axes[3].insert(r.phase);
    }
    extents_[kv.first] =
      AxisExtents{(Index)axes[0].size(), (Index)axes[1].size(), (Index)axes[2].size(), (Index)axes[3].size()};
  }
  for (auto const &kv : echoTimes) {
    scan_.echoTimes.push_back(kv.second);
  }
  Log::Print("Model", "{} valid records of {}, {} image types, {} warnings. Took {}", records_.size(), raw.rows.size(),
             extents_.size(), warnings_.size(), Log::ToNow(t0));
}

auto ParameterModel::source() const -> std::string const & { return source_; }
auto ParameterModel::scan() const -> ScanParameters const & { return scan_; }
auto ParameterModel::records() const -> std::vector<ParameterRecord> const & { return records_; }
auto ParameterModel::warnings() const -> Warnings const & { return warnings_; }
auto ParameterModel::nSlices() const -> Index { return nSlices_; }
auto ParameterModel::requiredBytes() const -> Index { return requiredBytes_; }
auto ParameterModel::declaredBytes() const -> std::optional<Index> { return declaredBytes_; }

auto ParameterModel::imageTypes() const -> std::vector<ImageType>
{
  std::vector<ImageType> types;
  for (auto const &kv : extents_) {
    types.push_back(kv.first);
  }
  return types;
}

auto ParameterModel::resolution(ImageType const t) const -> std::optional<Sz2>
{
  if (auto const r = resolutions_.find(t); r != resolutions_.end()) { return r->second; }
  return std::nullopt;
}

auto ParameterModel::extents(ImageType const t) const -> AxisExtents
{
  if (auto const e = extents_.find(t); e != extents_.end()) { return e->second; }
  return AxisExtents{};
}

} // namespace mm
