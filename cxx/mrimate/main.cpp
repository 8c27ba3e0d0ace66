#include "args.hpp"
#include "mm/log/log.hpp"

using namespace mm;

#define COMMAND(PARSER, NM, CMD, DESC)                                                                                         \
  void          main_##NM(args::Subparser &parser);                                                                            \
  args::Command NM(PARSER, CMD, DESC, &main_##NM);

int main(int const argc, char const *const argv[])
{
  args::ArgumentParser parser("MRIMATE");
  args::GlobalOptions  globals(parser, global_group);

  args::Group recon(parser, "RECON");
  COMMAND(recon, process, "process", "Reconstruct a PAR/REC pair into an H5 container");
  COMMAND(recon, describe, "describe", "Summarise the experiment in a PAR file");

  args::Group util(parser, "UTIL");
  COMMAND(util, h5, "h5", "Probe an H5 container");
  COMMAND(util, log, "log", "Print log to stdout");
  COMMAND(util, version, "version", "Print version number");

  try {
    parser.ParseCLI(argc, argv);
    Log::End();
  } catch (args::Help &) {
    fmt::print(stderr, "{}\n", parser.Help());
    return EXIT_SUCCESS;
  } catch (args::Error &e) {
    fmt::print(stderr, "{}\n", parser.Help());
    fmt::print(stderr, fmt::fg(fmt::terminal_color::bright_red), "{}\n", e.what());
    return EXIT_FAILURE;
  } catch (Log::Failure &f) {
    Log::Fail(f);
    Log::End();
    return EXIT_FAILURE;
  } catch (std::exception const &e) {
    Log::Fail(Log::Failure("None", "{}", e.what()));
    Log::End();
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
