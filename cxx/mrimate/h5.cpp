#include "args.hpp"

#include "mm/image.hpp"
#include "mm/io/reader.hpp"
#include "mm/log/log.hpp"

using namespace mm;

void main_h5(args::Subparser &parser)
{
  args::Positional<std::string> iname(parser, "FILE", "Input H5 container to dump info from");
  args::Flag                    all(parser, "META", "Print the scan parameters", {"all", 'a'});
  args::Flag                    header(parser, "HEADER", "Print the PAR general information", {"header"});
  ParseCommand(parser, iname);
  auto const  cmd = parser.GetCommand().Name();
  HD5::Reader reader(iname.Get());

  if (header) {
    auto const keys = reader.readStrings(HD5::Keys::HeaderKeys);
    auto const values = reader.readStrings(HD5::Keys::HeaderValues);
    if (keys.size() != values.size()) { throw Log::Failure(cmd, "Header in {} is inconsistent", iname.Get()); }
    for (size_t ii = 0; ii < keys.size(); ii++) {
      fmt::print("{}: {}\n", keys[ii], values[ii]);
    }
  } else if (all) {
    for (auto const &a : {"patient_name", "examination_name", "protocol_name", "examination_date_time", "series_type",
                          "technique", "scan_mode", "par_version"}) {
      if (reader.exists("/", a)) { fmt::print("{}: {}\n", a, reader.readAttributeString("/", a)); }
    }
  } else {
    auto const groups = reader.groups();
    bool       any = false;
    for (auto const &g : groups) {
      if (g == HD5::Keys::Header) { continue; }
      auto const ds = g + "/" + HD5::Keys::Data;
      fmt::print("Name: {:12} Shape: {:24} Names: {} Unit: {}\n", g, fmt::format("{}", reader.dimensions(ds)),
                 reader.readAttributeStrings(g, HD5::Attrs::Axes), reader.readAttributeString(g, HD5::Attrs::Unit));
      any = true;
    }
    if (!any) { throw Log::Failure(cmd, "No images found in {}", iname.Get()); }
  }
  Log::Print(cmd, "Finished");
}
