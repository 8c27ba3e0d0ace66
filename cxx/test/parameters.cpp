#include "fixture.hpp"

#include "mm/par/header.hpp"
#include "mm/par/parameters.hpp"

#include <algorithm>
#include <sstream>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace mm;
using namespace Catch;

namespace {
auto Model(std::vector<std::string> const &rows, std::string const &venc = "0.000  0.000  0.000", std::string const &extra = "")
  -> ParameterModel
{
  std::istringstream is(fixture::Par(rows, "V4.2", venc, extra));
  return ParameterModel(PAR::ParseHeader(is, "test.par"));
}
} // namespace

TEST_CASE("Scan parameters", "[model]")
{
  fixture::Row r;
  r.echoTime = 4.6f;

  SECTION("Canonical units")
  {
    auto const  m = Model({fixture::Line(r)});
    auto const &s = m.scan();
    CHECK(s.version == "V4.2");
    CHECK(s.patientName == "phantom");
    CHECK(s.technique == "FFE");
    CHECK(s.acquisitionNr == 3);
    CHECK(s.maxSlices == 2);
    CHECK(s.repetitionTime == Approx(0.025f));
    CHECK(s.scanDuration == Approx(12.5f));
    CHECK(s.scanResolution[0] == 64);
    CHECK(s.scanResolution[1] == 64);
    CHECK(s.fov[0] == Approx(200.f));
    CHECK(s.fov[1] == Approx(10.f));
    REQUIRE(s.echoTimes.size() == 1);
    CHECK(s.echoTimes[0] == Approx(0.0046f));
    CHECK_FALSE(s.venc().has_value());
    CHECK_FALSE(s.fieldStrength.has_value());
    CHECK(m.warnings().empty());
  }

  SECTION("Venc")
  {
    CHECK(Model({fixture::Line(r)}, "0.000  0.000  50.000").scan().venc().value() == Approx(50.f));
    CHECK(Model({fixture::Line(r)}, "-80.000  0.000  0.000").scan().venc().value() == Approx(80.f));
  }

  SECTION("Extra entries")
  {
    auto const m = Model({fixture::Line(r)}, "0 0 0", ".    Field strength [T]                 :   3.0\n.    Another key                        :   x\n");
    CHECK(m.scan().fieldStrength.value() == Approx(3.f));
    auto const &g = m.scan().general;
    CHECK(std::find_if(g.begin(), g.end(), [](auto const &kv) { return kv.first == "Another key"; }) != g.end());
  }

  SECTION("Invalid scan-level value")
  {
    auto const m = Model({fixture::Line(r)}, "0 0 0", ".    Acquisition nr                     :   abc\n");
    REQUIRE(m.warnings().size() == 1);
    CHECK(m.warnings().front().kind == Warning::Kind::InvalidParameter);
    CHECK(m.records().size() == 1);
  }
}

TEST_CASE("Record validation", "[model]")
{
  fixture::Row good;
  good.x = 4;
  good.y = 2;
  Index const bytes = 4 * 2 * 2;

  SECTION("Fields")
  {
    fixture::Row r = good;
    r.intercept = -2048.f;
    r.slope = 2.5f;
    r.spacing = 0.5f;
    r.type = 3;
    auto const m = Model({fixture::Line(r)});
    REQUIRE(m.records().size() == 1);
    auto const &p = m.records().front();
    CHECK(p.type == ImageType::Phase);
    CHECK(p.rows == 2);
    CHECK(p.cols == 4);
    CHECK(p.bytes == bytes);
    CHECK(p.offset == 0);
    CHECK(p.rescaleIntercept == Approx(-2048.f));
    CHECK(p.rescaleSlope == Approx(2.5f));
    CHECK(p.spacing[0] == Approx(0.5f));
    CHECK(p.echoTime == Approx(0.01f));
    CHECK(p.flipAngle == Approx(90.f));
  }

  SECTION("Negative index")
  {
    fixture::Row bad = good, next = good;
    bad.slice = -1;
    next.slice = 2;
    auto const m = Model({fixture::Line(good), fixture::Line(bad), fixture::Line(next)});
    REQUIRE(m.records().size() == 2);
    REQUIRE(m.warnings().size() == 1);
    CHECK(m.warnings().front().kind == Warning::Kind::InvalidParameter);
    // The excluded slab is still in the REC file
    CHECK(m.records()[1].offset == 2 * bytes);
    CHECK(m.records()[1].record == 2);
    CHECK(m.requiredBytes() == 3 * bytes);
    CHECK(m.declaredBytes().value() == 3 * bytes);
  }

  SECTION("Zero resolution takes no space")
  {
    fixture::Row bad = good, next = good;
    bad.x = 0;
    next.slice = 2;
    auto const m = Model({fixture::Line(good), fixture::Line(bad), fixture::Line(next)});
    REQUIRE(m.records().size() == 2);
    CHECK(m.warnings().size() == 1);
    CHECK(m.records()[1].offset == bytes);
  }

  SECTION("Unsupported sample width")
  {
    fixture::Row bad = good;
    bad.bits = 12;
    auto const m = Model({fixture::Line(good), fixture::Line(bad)});
    REQUIRE(m.records().size() == 1);
    CHECK(m.warnings().size() == 1);
    CHECK_FALSE(m.declaredBytes().has_value());
    // Nothing after the unsized slab can be placed
    CHECK_THROWS_AS(Model({fixture::Line(bad), fixture::Line(good)}), Log::Failure);
  }

  SECTION("Malformed rows keep their slabs")
  {
    fixture::Row next = good;
    next.slice = 2;
    auto const extra = fixture::Line(good) + " 17";
    auto const m = Model({extra, fixture::Line(next), extra});
    REQUIRE(m.records().size() == 1);
    CHECK(m.records()[0].record == 0);
    CHECK(m.records()[0].offset == bytes);
    CHECK(m.requiredBytes() == 2 * bytes);
    CHECK(m.declaredBytes().value() == 3 * bytes);
    REQUIRE(m.warnings().size() == 2);
    CHECK(m.warnings()[0].kind == Warning::Kind::MalformedRecord);
  }

  SECTION("Malformed row without a slab size")
  {
    auto const m = Model({fixture::Line(good), "1 1 1 1 0"});
    CHECK(m.records().size() == 1);
    CHECK_FALSE(m.declaredBytes().has_value());
    CHECK_THROWS_AS(Model({"1 1 1 1 0", fixture::Line(good)}), Log::Failure);
  }

  SECTION("Unknown image type")
  {
    fixture::Row bad = good;
    bad.type = 7;
    auto const m = Model({fixture::Line(bad), fixture::Line(good)});
    REQUIRE(m.records().size() == 1);
    CHECK(m.records()[0].offset == bytes);
  }

  SECTION("Non-positive spacing")
  {
    fixture::Row bad = good;
    bad.spacing = 0.f;
    auto const m = Model({fixture::Line(bad), fixture::Line(good)});
    CHECK(m.records().size() == 1);
    CHECK(m.warnings().size() == 1);
  }
}

TEST_CASE("Derived accessors", "[model]")
{
  std::vector<std::string> rows;
  for (Index d : {1, 2, 3}) {
    for (Index s : {3, 7}) {
      fixture::Row r;
      r.slice = s;
      r.dynamic = d;
      rows.push_back(fixture::Line(r));
      r.type = 3;
      rows.push_back(fixture::Line(r));
    }
  }
  fixture::Row extra;
  extra.slice = 9;
  extra.type = 3;
  rows.push_back(fixture::Line(extra));

  auto const m = Model(rows);
  CHECK(m.nSlices() == 3);
  auto const types = m.imageTypes();
  REQUIRE(types.size() == 2);
  CHECK(types[0] == ImageType::Magnitude);
  CHECK(types[1] == ImageType::Phase);
  CHECK(m.extents(ImageType::Magnitude).slices == 2);
  CHECK(m.extents(ImageType::Magnitude).dynamics == 3);
  CHECK(m.extents(ImageType::Phase).slices == 3);
  CHECK(m.extents(ImageType::Real).slices == 0);
  CHECK(m.requiredBytes() == 13 * 4 * 4 * 2);
}

TEST_CASE("Extents follow the assembled geometry", "[model]")
{
  std::vector<std::string> rows;
  for (Index s : {1, 2, 3, 4}) {
    fixture::Row r;
    r.slice = s;
    if (s == 4) { r.x = r.y = 8; }
    rows.push_back(fixture::Line(r));
  }
  for (Index s : {1, 2}) {
    fixture::Row r;
    r.slice = s;
    r.type = 1;
    r.x = 4 * s;
    rows.push_back(fixture::Line(r));
  }

  auto const m = Model(rows);
  CHECK(m.resolution(ImageType::Magnitude).value() == Sz2{4, 4});
  CHECK(m.extents(ImageType::Magnitude).slices == 3);
  CHECK_FALSE(m.resolution(ImageType::Real).has_value());
  CHECK(m.extents(ImageType::Real).slices == 0);
  CHECK(m.imageTypes().size() == 2);
}
