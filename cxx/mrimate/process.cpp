#include "args.hpp"

#include "mm/container.hpp"
#include "mm/crop.hpp"
#include "mm/log/log.hpp"
#include "mm/pipeline.hpp"

#include <map>

using namespace mm;

void main_process(args::Subparser &parser)
{
  args::Positional<std::string> iname(parser, "PAR", "Input PAR header");
  args::Positional<std::string> oname(parser, "OUTPUT", "Output H5 container (default PAR with .h5)");
  args::ValueFlag<std::string>  rec(parser, "REC", "REC file (default beside the PAR file)", {"rec"});
  args::Flag                    crop(parser, "C", "Crop images to their non-zero support", {"crop"});
  ParseCommand(parser, iname);
  auto const cmd = parser.GetCommand().Name();

  std::filesystem::path const par(iname.Get());
  auto recon = rec ? Reconstruct(par, std::filesystem::path(rec.Get())) : Reconstruct(par);
  if (crop) {
    for (auto &img : recon.images) {
      img = CropToSupport(img);
    }
  }
  std::map<Warning::Kind, Index> counts;
  for (auto const &w : recon.warnings) {
    counts[w.kind]++;
  }
  for (auto const &kv : counts) {
    Log::Warn(cmd, "{} {} warnings", kv.second, KindName(kv.first));
  }

  auto output = par;
  output.replace_extension(".h5");
  if (oname) { output = oname.Get(); }
  Export(output, recon.model, recon.images);
  Log::Print(cmd, "Finished");
}
