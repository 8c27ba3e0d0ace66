#include "fixture.hpp"

#include "mm/par/header.hpp"
#include "mm/par/schema.hpp"

#include <sstream>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace mm;
using namespace Catch;

TEST_CASE("Tokens", "[par]")
{
  CHECK(std::holds_alternative<Index>(PAR::Classify("42")));
  CHECK(std::holds_alternative<Index>(PAR::Classify("-2048")));
  CHECK(std::holds_alternative<double>(PAR::Classify("1.25")));
  CHECK(std::holds_alternative<std::string>(PAR::Classify("FFE")));
  CHECK(std::holds_alternative<std::string>(PAR::Classify("12abc")));
  CHECK(std::get<double>(PAR::Classify("2.5")) == Approx(2.5));
  auto const t = PAR::Tokenize("  200.000  10.000  200 ");
  REQUIRE(t.size() == 3);
  CHECK(std::holds_alternative<Index>(t[2]));
}

TEST_CASE("Keys", "[par]")
{
  CHECK(PAR::NormalizeKey("Repetition time [ms]") == "repetition time");
  CHECK(PAR::NormalizeKey("Max. number of slices/locations") == "max. number of slices/locations");
  CHECK(PAR::NormalizeKey("Scan resolution  (x, y)") == "scan resolution");
  CHECK(PAR::NormalizeKey("Flow compensation <0=no 1=yes> ?") == "flow compensation");
  CHECK(PAR::DeclaredVersion("# CLINICAL TRYOUT             Research image export tool     V4.1").value() == "V4.1");
  CHECK_FALSE(PAR::DeclaredVersion("# === GENERAL INFORMATION ====").has_value());
}

TEST_CASE("Schemas", "[par]")
{
  CHECK(PAR::Width(PAR::SchemaFor("V4")) == 41);
  CHECK(PAR::Width(PAR::SchemaFor("V4.1")) == 48);
  CHECK(PAR::Width(PAR::SchemaFor("V4.2")) == 49);
  CHECK_FALSE(PAR::IsSupported("V3"));
}

TEST_CASE("Header", "[par]")
{
  fixture::Row r0, r1;
  r1.slice = 2;

  SECTION("Basic")
  {
    std::istringstream is(fixture::Par({fixture::Line(r0), fixture::Line(r1)}));
    auto const         h = PAR::ParseHeader(is, "test.par");
    CHECK(h.version == "V4.2");
    CHECK(h.rows.size() == 2);
    CHECK(h.warnings.empty());
    auto const tr = h.find("repetition time");
    REQUIRE(tr);
    CHECK(tr->unit == "ms");
    CHECK(tr->text == "25.000");
    REQUIRE(h.rows[1].fields.at(PAR::Columns::Slice).size() == 1);
    CHECK(std::get<Index>(h.rows[1].fields.at(PAR::Columns::Slice)[0]) == 2);
    CHECK(h.rows[0].fields.at(PAR::Columns::Resolution).size() == 2);
  }

  SECTION("Versions")
  {
    for (auto const v : {"V4", "V4.1"}) {
      std::istringstream is(fixture::Par({fixture::Line(r0, v)}, v));
      auto const         h = PAR::ParseHeader(is, "test.par");
      CHECK(h.version == v);
      CHECK(h.rows.size() == 1);
      CHECK(h.warnings.empty());
    }
  }

  SECTION("Unknown keys are kept")
  {
    std::istringstream is(fixture::Par({fixture::Line(r0)}, "V4.2", "0 0 0", ".    Some future key [au]               :   abc 12\n"));
    auto const         h = PAR::ParseHeader(is, "test.par");
    auto const         e = h.find("some future key");
    REQUIRE(e);
    CHECK(e->key == "Some future key [au]");
    CHECK(e->text == "abc 12");
  }

  SECTION("Malformed row")
  {
    auto bad = fixture::Line(r1);
    bad = bad.substr(0, bad.rfind(' '));
    std::istringstream is(fixture::Par({fixture::Line(r0), bad, fixture::Line(r1)}));
    auto const         h = PAR::ParseHeader(is, "test.par");
    CHECK(h.rows.size() == 2);
    REQUIRE(h.warnings.size() == 1);
    CHECK(h.warnings.front().kind == Warning::Kind::MalformedRecord);
    REQUIRE(h.skipped.size() == 1);
    CHECK(h.skipped[0].before == 1);
    CHECK(h.skipped[0].partial.fields.at(PAR::Columns::Resolution).size() == 2);
    CHECK_FALSE(h.skipped[0].partial.fields.contains(PAR::Columns::LabelType));
  }

  SECTION("Mismatched version")
  {
    // V4 rows under a V4.2 declaration are too short
    std::istringstream is(fixture::Par({fixture::Line(r0, "V4"), fixture::Line(r1)}));
    auto const         h = PAR::ParseHeader(is, "test.par");
    CHECK(h.rows.size() == 1);
    CHECK(h.warnings.size() == 1);
  }

  SECTION("Unsupported version")
  {
    std::istringstream is(fixture::Par({fixture::Line(r0)}, "V5"));
    CHECK_THROWS_AS(PAR::ParseHeader(is, "test.par"), UnsupportedVersionError);
  }

  SECTION("No version")
  {
    std::istringstream is(".    Patient name   :   phantom\n" + fixture::Line(r0) + "\n");
    CHECK_THROWS_AS(PAR::ParseHeader(is, "test.par"), UnsupportedVersionError);
  }
}
