#include "args.hpp"

#include "mm/describe.hpp"
#include "mm/log/log.hpp"
#include "mm/par/header.hpp"
#include "mm/par/parameters.hpp"

using namespace mm;

void main_describe(args::Subparser &parser)
{
  args::Positional<std::string> iname(parser, "PAR", "Input PAR header");
  args::Flag                    records(parser, "R", "Print the extents of each image type", {"records", 'r'});
  ParseCommand(parser, iname);
  auto const cmd = parser.GetCommand().Name();

  ParameterModel const model(PAR::ReadHeader(iname.Get()));
  fmt::print("{}", Describe(model.scan()));
  if (records) {
    fmt::print("\nImage Types:\n");
    for (auto const t : model.imageTypes()) {
      auto const res = model.resolution(t);
      if (!res) {
        fmt::print("- {:10} dropped, no common resolution\n", ImageTypeName(t));
        continue;
      }
      auto const e = model.extents(t);
      fmt::print("- {:10} {}x{} slices {} echoes {} dynamics {} phases {}\n", ImageTypeName(t), (*res)[1], (*res)[0],
                 e.slices, e.echoes, e.dynamics, e.phases);
    }
    fmt::print("Records: {} valid, {} warnings\n", model.records().size(), model.warnings().size());
  }
  Log::Print(cmd, "Finished");
}
