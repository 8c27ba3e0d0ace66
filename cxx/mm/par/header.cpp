#include "header.hpp"

#include "../log/log.hpp"
#include "schema.hpp"

#include <cctype>
#include <fstream>
#include <scn/scan.h>

namespace mm {
namespace PAR {

namespace {
auto Trim(std::string_view s) -> std::string_view
{
  auto const b = s.find_first_not_of(" \t\r\n");
  if (b == std::string_view::npos) { return {}; }
  auto const e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

auto Split(std::string_view s) -> std::vector<std::string_view>
{
  std::vector<std::string_view> parts;
  std::string_view::size_type   pos = 0;
  while (pos < s.size()) {
    auto const b = s.find_first_not_of(" \t\r\n", pos);
    if (b == std::string_view::npos) { break; }
    auto const e = s.find_first_of(" \t\r\n", b);
    parts.push_back(s.substr(b, e == std::string_view::npos ? std::string_view::npos : e - b));
    pos = e;
  }
  return parts;
}

auto ParseGeneral(std::string_view const line, Index const lineNo) -> GeneralEntry
{
  auto const body = line.substr(1); // Drop the leading '.'
  auto const colon = body.find(':');
  auto const key = Trim(body.substr(0, colon));
  auto const value = colon == std::string_view::npos ? std::string_view{} : Trim(body.substr(colon + 1));

  GeneralEntry entry{.key = std::string(key), .name = NormalizeKey(key), .text = std::string(value), .line = lineNo};
  if (auto const ob = key.find('['); ob != std::string_view::npos) {
    auto const cb = key.find(']', ob);
    if (cb != std::string_view::npos) { entry.unit = std::string(Trim(key.substr(ob + 1, cb - ob - 1))); }
  }
  entry.tokens = Tokenize(value);
  return entry;
}

// Fills the leading columns that the tokens cover
auto SplitColumns(std::vector<std::string_view> const &parts, std::string_view const line, Index const lineNo, Schema const &schema)
  -> RawRow
{
  RawRow row{.line = lineNo, .text = std::string(line)};
  auto   p = parts.begin();
  for (auto const &col : schema) {
    if (parts.end() - p < col.width) { break; }
    auto &tokens = row.fields[col.name];
    for (Index ii = 0; ii < col.width; ii++) {
      tokens.push_back(Classify(*p++));
    }
  }
  return row;
}

auto ParseRow(std::string_view const line, Index const lineNo, Schema const &schema, std::string const &source) -> RawRow
{
  auto const  parts = Split(line);
  Index const expected = Width(schema);
  if ((Index)parts.size() != expected) {
    throw MalformedRecordError(source, lineNo, std::string(line), parts.size(), expected);
  }
  return SplitColumns(parts, line, lineNo, schema);
}
} // namespace

auto Classify(std::string_view const text) -> Token
{
  if (auto const i = scn::scan<Index>(text, "{}"); i && i->range().empty()) { return Token{i->value()}; }
  if (auto const d = scn::scan<double>(text, "{}"); d && d->range().empty()) { return Token{d->value()}; }
  return Token{std::string(text)};
}

auto ToString(Token const &t) -> std::string
{
  if (auto const s = std::get_if<std::string>(&t)) { return *s; }
  if (auto const i = std::get_if<Index>(&t)) { return fmt::format("{}", *i); }
  return fmt::format("{}", std::get<double>(t));
}

auto Tokenize(std::string_view const text) -> std::vector<Token>
{
  std::vector<Token> tokens;
  for (auto const p : Split(text)) {
    tokens.push_back(Classify(p));
  }
  return tokens;
}

auto NormalizeKey(std::string_view const key) -> std::string
{
  auto const  cut = key.find_first_of("[(<");
  std::string name;
  bool        space = false;
  for (char const c : Trim(key.substr(0, cut))) {
    if (std::isspace(static_cast<unsigned char>(c))) {
      space = true;
    } else {
      if (space && !name.empty()) { name.push_back(' '); }
      space = false;
      name.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
  }
  return name;
}

auto DeclaredVersion(std::string_view const comment) -> std::optional<std::string>
{
  if (comment.find("CLINICAL TRYOUT") == std::string_view::npos) { return std::nullopt; }
  auto const parts = Split(comment);
  return std::string(parts.back());
}

auto RawHeader::find(std::string const &name) const -> GeneralEntry const *
{
  for (auto const &g : general) {
    if (g.name == name) { return &g; }
  }
  return nullptr;
}

auto ParseHeader(std::istream &is, std::string const &source) -> RawHeader
{
  RawHeader     h{.source = source};
  Schema const *schema = nullptr;
  std::string   line;
  Index         lineNo = 0;
  while (std::getline(is, line)) {
    lineNo++;
    auto const trimmed = Trim(line);
    if (trimmed.empty()) { continue; }
    if (trimmed.front() == '#') {
      if (auto const v = DeclaredVersion(trimmed)) {
        if (!IsSupported(*v)) { throw UnsupportedVersionError(source, *v); }
        h.version = *v;
        schema = &SchemaFor(h.version);
        Log::Debug("PAR", "{} declares version {} with {} columns", source, h.version, Width(*schema));
      }
    } else if (trimmed.front() == '.') {
      h.general.push_back(ParseGeneral(trimmed, lineNo));
    } else {
      if (schema == nullptr) { throw UnsupportedVersionError(source, ""); }
      try {
        h.rows.push_back(ParseRow(trimmed, lineNo, *schema, source));
      } catch (MalformedRecordError const &e) {
        Surface(Warning::Kind::MalformedRecord, e, h.warnings);
        h.skipped.push_back(SkippedRow{(Index)h.rows.size(), SplitColumns(Split(trimmed), trimmed, lineNo, *schema)});
      }
    }
  }
  if (is.bad()) { throw Log::Failure("PAR", "Error reading {} at line {}", source, lineNo); }
  if (schema == nullptr) { throw UnsupportedVersionError(source, ""); }
  Log::Print("PAR", "{} V{}: {} general entries, {} image rows, {} malformed", source, h.version.substr(1), h.general.size(),
             h.rows.size(), h.warnings.size());
  return h;
}

auto ReadHeader(std::filesystem::path const &path) -> RawHeader
{
  std::ifstream is(path);
  if (!is) { throw Log::Failure("PAR", "Could not open {}", path.string()); }
  return ParseHeader(is, path.string());
}

} // namespace PAR
} // namespace mm
