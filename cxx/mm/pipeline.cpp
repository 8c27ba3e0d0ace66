#include "pipeline.hpp"

#include "log/log.hpp"
#include "par/header.hpp"
#include "rescale.hpp"

#include <fstream>

namespace mm {

auto FindRec(std::filesystem::path const &par) -> std::filesystem::path
{
  for (auto const ext : {".rec", ".REC"}) {
    auto rec = par;
    rec.replace_extension(ext);
    if (std::filesystem::exists(rec)) { return rec; }
  }
  throw Log::Failure("Pipeline", "Could not find a REC file for {}", par.string());
}

auto Reconstruct(std::istream &par, std::string const &source, RecSource const &rec) -> Reconstruction
{
  auto const t0 = Log::Now();
  auto const raw = PAR::ParseHeader(par, source);
  Reconstruction recon{.model = ParameterModel(raw)};
  auto const &model = recon.model;
  if (model.records().empty()) { throw Log::Failure("Pipeline", "{} has no valid records", source); }
  recon.warnings = model.warnings();

  auto assembly = Assemble(model, rec);
  recon.warnings.insert(recon.warnings.end(), assembly.warnings.begin(), assembly.warnings.end());
  if (assembly.images.empty()) { throw Log::Failure("Pipeline", "Every image type in {} was dropped", source); }

  Rescale(model, assembly.images);
  recon.images = std::move(assembly.images);
  Log::Print("Pipeline", "Reconstructed {} with {} warnings. Took {}", source, recon.warnings.size(), Log::ToNow(t0));
  return recon;
}

auto Reconstruct(std::filesystem::path const &par, std::optional<std::filesystem::path> const &rec) -> Reconstruction
{
  std::ifstream ifs(par);
  if (!ifs) { throw Log::Failure("Pipeline", "Could not open {}", par.string()); }
  RecFile const recFile(rec ? *rec : FindRec(par));
  return Reconstruct(ifs, par.string(), recFile);
}

} // namespace mm
