#pragma once

#include "assemble.hpp"
#include "image.hpp"
#include "par/parameters.hpp"
#include "rec.hpp"

#include <filesystem>
#include <istream>
#include <optional>

namespace mm {

/*
 * Everything a successful run produces. Recoverable problems from every stage are in warnings,
 * in the order they were found.
 */
struct Reconstruction
{
  ParameterModel          model;
  std::vector<ImageArray> images;
  Warnings                warnings;
};

// The REC file beside a PAR file, trying both extension cases
auto FindRec(std::filesystem::path const &par) -> std::filesystem::path;

auto Reconstruct(std::istream &par, std::string const &source, RecSource const &rec) -> Reconstruction;
auto Reconstruct(std::filesystem::path const &par, std::optional<std::filesystem::path> const &rec = std::nullopt)
  -> Reconstruction;

} // namespace mm
