#pragma once

#include "par/parameters.hpp"

#include <string>

namespace mm {

// "2023.05.17 / 10:11:12" to "May 17, 2023". Throws if the text is not a PAR date.
auto FormatDate(std::string const &examinationDateTime) -> std::string;

// Human-readable summary of the experiment
auto Describe(ScanParameters const &scan) -> std::string;

} // namespace mm
