#include "describe.hpp"

#include "log/log.hpp"

#include <array>
#include <scn/scan.h>

namespace mm {

namespace {
std::array<char const *, 12> const months{"January", "February", "March",     "April",   "May",      "June",
                                          "July",    "August",   "September", "October", "November", "December"};

auto Contains3D(std::string const &s) -> bool { return s.find("3D") != std::string::npos; }
} // namespace

auto FormatDate(std::string const &text) -> std::string
{
  auto const ymd = scn::scan<int, int, int>(text, "{}.{}.{}");
  if (!ymd) { throw Log::Failure("Describe", "Could not read date from '{}'", text); }
  auto const [y, m, d] = ymd->values();
  if (m < 1 || m > 12 || d < 1 || d > 31) { throw Log::Failure("Describe", "Date '{}' is out of range", text); }
  return fmt::format("{} {:02d}, {}", months[m - 1], d, y);
}

auto Describe(ScanParameters const &s) -> std::string
{
  auto const date = s.examinationDateTime.empty() ? std::string("Unknown") : FormatDate(s.examinationDateTime);
  auto const dimension = Contains3D(s.seriesType) || Contains3D(s.scanMode) ? "3D" : "2D";
  auto const dynamics = s.maxDynamics > 1 ? fmt::format("{}", s.maxDynamics) : std::string("None");

  std::string d = "Experiment Details:\n";
  d += fmt::format("- Type: {}\n", s.seriesType);
  d += fmt::format("- Date: {}\n\n", date);
  d += "Scan Information:\n";
  d += fmt::format("- Technique: {}\n", s.technique);
  d += fmt::format("- Dimension: {}\n", dimension);
  d += fmt::format("- Resolution: {}x{} pixels\n", s.scanResolution[0], s.scanResolution[1]);
  d += fmt::format("- Slices: {}\n", s.maxSlices);
  d += fmt::format("- Dynamics: {}\n", dynamics);
  d += fmt::format("- Flow Encoding: {}\n", s.venc() ? "Yes" : "No");
  d += fmt::format("- Diffusion Encoding: {}\n", s.diffusion ? "Yes" : "No");
  return d;
}

} // namespace mm
