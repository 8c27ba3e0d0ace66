#include "container.hpp"

#include "errors.hpp"
#include "io/reader.hpp"
#include "io/writer.hpp"
#include "log/log.hpp"

#include <algorithm>

namespace mm {

namespace {
template <int N> auto ToVector(Eigen::Array<float, N, 1> const &a) -> std::vector<float>
{
  return std::vector<float>(a.data(), a.data() + N);
}

void WriteScan(HD5::Writer &writer, ParameterModel const &model)
{
  auto const &s = model.scan();
  std::string const root = "/";
  writer.writeAttribute(root, "par_version", s.version);
  writer.writeAttribute(root, "source", model.source());
  writer.writeAttribute(root, "patient_name", s.patientName);
  writer.writeAttribute(root, "examination_name", s.examinationName);
  writer.writeAttribute(root, "protocol_name", s.protocolName);
  writer.writeAttribute(root, "examination_date_time", s.examinationDateTime);
  writer.writeAttribute(root, "series_type", s.seriesType);
  writer.writeAttribute(root, "acquisition_nr", s.acquisitionNr);
  writer.writeAttribute(root, "reconstruction_nr", s.reconstructionNr);
  writer.writeAttribute(root, "scan_duration", s.scanDuration);
  writer.writeAttribute(root, "max_cardiac_phases", s.maxCardiacPhases);
  writer.writeAttribute(root, "max_echoes", s.maxEchoes);
  writer.writeAttribute(root, "max_slices", s.maxSlices);
  writer.writeAttribute(root, "max_dynamics", s.maxDynamics);
  writer.writeAttribute(root, "max_mixes", s.maxMixes);
  writer.writeAttribute(root, "patient_position", s.patientPosition);
  writer.writeAttribute(root, "preparation_direction", s.preparationDirection);
  writer.writeAttribute(root, "technique", s.technique);
  writer.writeAttribute(root, "scan_resolution", std::vector<Index>(s.scanResolution.begin(), s.scanResolution.end()));
  writer.writeAttribute(root, "scan_mode", s.scanMode);
  writer.writeAttribute(root, "repetition_time", s.repetitionTime);
  if (s.echoTimes.size()) { writer.writeAttribute(root, "echo_times", s.echoTimes); }
  writer.writeAttribute(root, "fov", ToVector<3>(s.fov));
  writer.writeAttribute(root, "water_fat_shift", s.waterFatShift);
  writer.writeAttribute(root, "angulation_midslice", ToVector<3>(s.angulationMidslice));
  writer.writeAttribute(root, "offcentre_midslice", ToVector<3>(s.offcentreMidslice));
  writer.writeAttribute(root, "flow_compensation", s.flowCompensation);
  writer.writeAttribute(root, "presaturation", s.presaturation);
  writer.writeAttribute(root, "phase_encoding_velocity", ToVector<3>(s.phaseEncodingVelocity));
  writer.writeAttribute(root, "mtc", s.mtc);
  writer.writeAttribute(root, "spir", s.spir);
  writer.writeAttribute(root, "epi_factor", s.epiFactor);
  writer.writeAttribute(root, "dynamic_scan", s.dynamicScan);
  writer.writeAttribute(root, "diffusion", s.diffusion);
  writer.writeAttribute(root, "diffusion_echo_time", s.diffusionEchoTime);
  writer.writeAttribute(root, "max_diffusion_values", s.maxDiffusionValues);
  writer.writeAttribute(root, "max_gradient_orients", s.maxGradientOrients);
  writer.writeAttribute(root, "number_of_label_types", s.numberOfLabelTypes);
  if (s.fieldStrength) { writer.writeAttribute(root, "field_strength", *s.fieldStrength); }

  std::vector<std::string> keys, values;
  for (auto const &kv : s.general) {
    keys.push_back(kv.first);
    values.push_back(kv.second);
  }
  writer.createGroup(HD5::Keys::Header);
  writer.writeStrings(HD5::Keys::HeaderKeys, keys);
  writer.writeStrings(HD5::Keys::HeaderValues, values);
}

void WriteImage(HD5::Writer &writer, ImageArray const &img)
{
  auto const name = img.name();
  writer.createGroup(name);
  writer.writeTensor(name + "/" + HD5::Keys::Data, ToArray(img.data.dimensions()), img.data.data(), img.axes);
  writer.writeTensor(name + "/" + HD5::Keys::Source, ToArray(img.source.dimensions()), img.source.data(), HD5::Dims::Slabs);
  writer.writeAttribute(name, HD5::Attrs::Axes, std::vector<std::string>(img.axes.begin(), img.axes.end()));
  writer.writeAttribute(name, HD5::Attrs::Unit, UnitName(img.unit));
  writer.writeAttribute(name, HD5::Attrs::Rescaled, Index(img.rescaled ? 1 : 0));
  writer.writeAttribute(name, HD5::Attrs::SliceLabels, img.labels[0]);
  writer.writeAttribute(name, HD5::Attrs::EchoLabels, img.labels[1]);
  writer.writeAttribute(name, HD5::Attrs::DynamicLabels, img.labels[2]);
  writer.writeAttribute(name, HD5::Attrs::PhaseLabels, img.labels[3]);
}
} // namespace

void Export(std::filesystem::path const &target, ParameterModel const &model, std::vector<ImageArray> const &images)
{
  auto const t0 = Log::Now();
  auto const partial = std::filesystem::path(target.string() + ".partial");
  try {
    {
      HD5::Writer writer(partial.string());
      WriteScan(writer, model);
      writer.writeStruct(HD5::Keys::Records, model.records());
      for (auto const &img : images) {
        WriteImage(writer, img);
      }
      Log::Print("Export", "Wrote {} image types to {}. Took {}", images.size(), target.string(), Log::ToNow(t0));
      std::vector<std::string> const entries = Log::Saved();
      writer.writeStrings(HD5::Keys::Log, entries);
      writer.flush();
    }
    std::filesystem::rename(partial, target);
  } catch (std::exception const &e) {
    std::error_code ec;
    std::filesystem::remove(partial, ec);
    throw ExportError(target.string(), e.what());
  }
}

auto Import(std::filesystem::path const &path) -> std::vector<ImageArray>
{
  HD5::Reader             reader(path.string());
  std::vector<ImageArray> images;
  for (auto const &g : reader.groups()) {
    if (g == HD5::Keys::Header) { continue; }
    ImageArray img;
    img.type = ImageTypeFromName(g);
    img.data = reader.readTensor<Re6>(g + "/" + HD5::Keys::Data);
    img.source = reader.readTensor<I4>(g + "/" + HD5::Keys::Source);
    auto const axes = reader.readAttributeStrings(g, HD5::Attrs::Axes);
    if (axes.size() != 6) { throw Log::Failure("Import", "Group {} in {} lists {} axes", g, path.string(), axes.size()); }
    std::copy_n(axes.begin(), 6, img.axes.begin());
    img.unit = UnitFromName(reader.readAttributeString(g, HD5::Attrs::Unit));
    img.rescaled = reader.readAttributeInt(g, HD5::Attrs::Rescaled) != 0;
    img.labels[0] = reader.readAttributeInts(g, HD5::Attrs::SliceLabels);
    img.labels[1] = reader.readAttributeInts(g, HD5::Attrs::EchoLabels);
    img.labels[2] = reader.readAttributeInts(g, HD5::Attrs::DynamicLabels);
    img.labels[3] = reader.readAttributeInts(g, HD5::Attrs::PhaseLabels);
    images.push_back(std::move(img));
  }
  std::sort(images.begin(), images.end(), [](ImageArray const &a, ImageArray const &b) { return a.type < b.type; });
  return images;
}

auto ImportRecords(std::filesystem::path const &path) -> std::vector<ParameterRecord>
{
  HD5::Reader reader(path.string());
  return reader.readStruct<std::vector<ParameterRecord>>(HD5::Keys::Records);
}

} // namespace mm
