#pragma once

#include "../errors.hpp"
#include "../types.hpp"

#include <filesystem>
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace mm {
namespace PAR {

/*
 * Header tokens are kept loosely typed until the ParameterModel validates them
 */
using Token = std::variant<Index, double, std::string>;

auto Classify(std::string_view const text) -> Token;
auto ToString(Token const &t) -> std::string;
auto Tokenize(std::string_view const text) -> std::vector<Token>;

// A `.  key : value` line from the general information section
struct GeneralEntry
{
  std::string        key;  // Verbatim, e.g. "Repetition time [ms]"
  std::string        name; // Normalized, e.g. "repetition time"
  std::string        unit; // From the bracketed suffix, e.g. "ms"
  std::string        text; // Verbatim value
  std::vector<Token> tokens;
  Index              line;
};

// One row of the image information table, split into named columns
struct RawRow
{
  Index                                     line;
  std::string                               text;
  std::map<std::string, std::vector<Token>> fields;
};

/*
 * A malformed image row. Its slab is still in the REC file, so the leading columns it did hold
 * are kept to size that slab.
 */
struct SkippedRow
{
  Index  before; // Number of well-formed rows declared ahead of it
  RawRow partial;
};

struct RawHeader
{
  std::string               source;
  std::string               version;
  std::vector<GeneralEntry> general;
  std::vector<RawRow>       rows;
  std::vector<SkippedRow>   skipped;
  Warnings                  warnings;

  auto find(std::string const &name) const -> GeneralEntry const *;
};

auto NormalizeKey(std::string_view const key) -> std::string;
auto DeclaredVersion(std::string_view const comment) -> std::optional<std::string>;

auto ParseHeader(std::istream &is, std::string const &source) -> RawHeader;
auto ReadHeader(std::filesystem::path const &path) -> RawHeader;

} // namespace PAR
} // namespace mm
