#pragma once

#include "mm/rec.hpp"

#include <cstdint>
#include <fmt/format.h>
#include <string>
#include <vector>

// Builders for small synthetic PAR/REC pairs
namespace fixture {

struct Row
{
  Index slice = 1, echo = 1, dynamic = 1, phase = 1, type = 0, bits = 16, x = 4, y = 4;
  float intercept = 0.f, slope = 1.f, scale = 1.f;
  float spacing = 1.f;
  float echoTime = 10.f;
};

inline auto Line(Row const &r, std::string const &version = "V4.2") -> std::string
{
  auto line = fmt::format("{} {} {} {} {} 0 0 {} 100 {} {} {} {} {} 1000 2000 0.0 0.0 0.0 0.0 0.0 0.0 5.0 1.0 0 1 0 2 "
                          "{} {} {} 0.0 0.0 0.0 1 90.0 0 0 0 0 0.0",
                          r.slice, r.echo, r.dynamic, r.phase, r.type, r.bits, r.x, r.y, r.intercept, r.slope, r.scale,
                          r.spacing, r.spacing, r.echoTime);
  if (version != "V4") { line += " 0 0 0 0 0.0 0.0 0.0"; }
  if (version == "V4.2") { line += " 0"; }
  return line;
}

inline auto Par(std::vector<std::string> const &rows,
                std::string const         &version = "V4.2",
                std::string const         &venc = "0.000  0.000  0.000",
                std::string const         &extra = "") -> std::string
{
  std::string par = fmt::format("# === DATA DESCRIPTION FILE ======================================================\n"
                                "#\n"
                                "# Dataset name: E:\\Export\\phantom\n"
                                "#\n"
                                "# CLINICAL TRYOUT             Research image export tool     {}\n"
                                "#\n"
                                "# === GENERAL INFORMATION ========================================================\n"
                                "#\n"
                                ".    Patient name                       :   phantom\n"
                                ".    Examination name                   :   mrimate\n"
                                ".    Protocol name                      :   WIP flow\n"
                                ".    Examination date/time              :   2023.05.17 / 10:11:12\n"
                                ".    Series Type                        :   Image   MRSERIES\n"
                                ".    Acquisition nr                     :   3\n"
                                ".    Reconstruction nr                  :   1\n"
                                ".    Scan Duration [sec]                :   12.5\n"
                                ".    Max. number of cardiac phases      :   1\n"
                                ".    Max. number of echoes              :   1\n"
                                ".    Max. number of slices/locations    :   2\n"
                                ".    Max. number of dynamics            :   1\n"
                                ".    Max. number of mixes               :   1\n"
                                ".    Patient position                   :   Head First Supine\n"
                                ".    Preparation direction              :   Right-Left\n"
                                ".    Technique                          :   FFE\n"
                                ".    Scan resolution  (x, y)            :   64  64\n"
                                ".    Scan mode                          :   MS\n"
                                ".    Repetition time [ms]               :   25.000\n"
                                ".    FOV (ap,fh,rl) [mm]                :   200.000  10.000  200.000\n"
                                ".    Water Fat shift [pixels]           :   1.500\n"
                                ".    Angulation midslice(ap,fh,rl)[degr]:   0.000  0.000  0.000\n"
                                ".    Off Centre midslice(ap,fh,rl) [mm] :   0.000  0.000  0.000\n"
                                ".    Flow compensation <0=no 1=yes> ?   :   0\n"
                                ".    Presaturation     <0=no 1=yes> ?   :   0\n"
                                ".    Phase encoding velocity [cm/sec]   :   {}\n"
                                ".    MTC               <0=no 1=yes> ?   :   0\n"
                                ".    SPIR              <0=no 1=yes> ?   :   0\n"
                                ".    EPI factor        <0,1=no EPI>     :   1\n"
                                ".    Dynamic scan      <0=no 1=yes> ?   :   0\n"
                                ".    Diffusion         <0=no 1=yes> ?   :   0\n"
                                ".    Diffusion echo time [ms]           :   0.0000\n"
                                "{}"
                                "#\n"
                                "# === IMAGE INFORMATION ==========================================================\n"
                                "#\n",
                                version, venc, extra);
  for (auto const &r : rows) {
    par += r + "\n";
  }
  par += "\n# === END OF DATA DESCRIPTION FILE ===============================================\n";
  return par;
}

// Little-endian 16-bit slab of a constant value
inline void AppendSlab(std::vector<char> &rec, Index const n, uint16_t const value)
{
  for (Index ii = 0; ii < n; ii++) {
    rec.push_back(static_cast<char>(value & 0xFF));
    rec.push_back(static_cast<char>(value >> 8));
  }
}

inline void AppendValues(std::vector<char> &rec, std::vector<uint16_t> const &values)
{
  for (auto const v : values) {
    AppendSlab(rec, 1, v);
  }
}

} // namespace fixture
