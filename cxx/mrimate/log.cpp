#include "args.hpp"

#include "mm/io/reader.hpp"
#include "mm/log/log.hpp"

using namespace mm;

void main_log(args::Subparser &parser)
{
  args::Positional<std::string> iname(parser, "FILE", "H5 container to dump log from");
  args::ValueFlag<std::string>  filter(parser, "F", "Filter category", {"filter", 'f'});
  ParseCommand(parser, iname);
  auto const  cmd = parser.GetCommand().Name();
  HD5::Reader reader(iname.Get());
  if (reader.exists(HD5::Keys::Log)) {
    auto const entries = reader.readStrings(HD5::Keys::Log);
    for (auto const &entry : entries) {
      if (!filter || (entry.substr(12, filter.Get().length()) == filter.Get())) { fmt::print("{}\n", entry); }
    }
  } else {
    throw Log::Failure(cmd, "File {} does not contain a log", iname.Get());
  }
  Log::Print(cmd, "Finished");
}
