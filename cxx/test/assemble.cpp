#include "fixture.hpp"

#include "mm/assemble.hpp"
#include "mm/par/header.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace mm;
using namespace Catch;

namespace {
auto Model(std::vector<fixture::Row> const &rows) -> ParameterModel
{
  std::vector<std::string> lines;
  for (auto const &r : rows) {
    lines.push_back(fixture::Line(r));
  }
  std::istringstream is(fixture::Par(lines));
  return ParameterModel(PAR::ParseHeader(is, "test.par"));
}

auto Count(Warnings const &ws, Warning::Kind const k) -> Index
{
  return std::count_if(ws.begin(), ws.end(), [k](Warning const &w) { return w.kind == k; });
}
} // namespace

TEST_CASE("Slab decoding", "[assemble]")
{
  ParameterRecord r;
  r.rows = 2;
  r.cols = 3;

  SECTION("Row major")
  {
    std::vector<char> bytes;
    fixture::AppendValues(bytes, {1, 2, 3, 4, 5, 6});
    r.bits = 16;
    r.bytes = 12;
    auto const slab = ReadSlab(RecBuffer("test.rec", bytes), r);
    CHECK(slab(0, 2) == 3.f);
    CHECK(slab(1, 0) == 4.f);
  }

  SECTION("Wide samples round to float")
  {
    std::vector<char> bytes(24, 0);
    bytes[0] = 7;
    bytes[20] = 1;
    bytes[23] = 1; // 2^24 + 1
    r.bits = 32;
    r.bytes = 24;
    auto const slab = ReadSlab(RecBuffer("test.rec", bytes), r);
    CHECK(slab(0, 0) == 7.f);
    CHECK(slab(1, 2) == 16777216.f);
    REQUIRE_FALSE(Log::Saved().empty());
    CHECK(Log::Saved().back().find("beyond float precision") != std::string::npos);
  }
}

TEST_CASE("Axis maps", "[assemble]")
{
  AxisMap m;
  for (Index v : {7, 3, 12, 3}) {
    m.insert(v);
  }
  m.freeze();
  CHECK(m.size() == 3);
  CHECK(m.position(3) == 0);
  CHECK(m.position(7) == 1);
  CHECK(m.position(12) == 2);
  CHECK(m.labels() == std::vector<Index>{3, 7, 12});
  CHECK_THROWS_AS(m.position(5), Log::Failure);
}

TEST_CASE("Common resolution", "[assemble]")
{
  ParameterRecord a, b;
  a.rows = 4;
  a.cols = 4;
  b.rows = 2;
  b.cols = 2;
  CHECK(CommonResolution({a, a, b}).value() == Sz2{4, 4});
  CHECK_FALSE(CommonResolution({a, b}).has_value());
  CHECK_FALSE(CommonResolution({}).has_value());
}

TEST_CASE("Assemble", "[assemble]")
{
  SECTION("Slab layout")
  {
    fixture::Row r;
    r.x = 3;
    r.y = 2;
    auto const        m = Model({r});
    std::vector<char> bytes;
    fixture::AppendValues(bytes, {0, 1, 2, 3, 4, 5});
    auto const a = Assemble(m, RecBuffer("test.rec", bytes));
    REQUIRE(a.images.size() == 1);
    auto const &d = a.images[0].data;
    REQUIRE(d.dimension(0) == 2);
    REQUIRE(d.dimension(1) == 3);
    for (Index ir = 0; ir < 2; ir++) {
      for (Index ic = 0; ic < 3; ic++) {
        CHECK(d(ir, ic, 0, 0, 0, 0) == Approx(ir * 3 + ic));
      }
    }
    CHECK(a.images[0].unit == Unit::Dimensionless);
    CHECK_FALSE(a.images[0].rescaled);
  }

  SECTION("Dense grid with sparse indices")
  {
    std::vector<fixture::Row> rows;
    std::vector<char>         bytes;
    // Declared out of order to check the mapping is monotonic
    for (Index d : {5, 2}) {
      for (Index s : {9, 4, 6}) {
        fixture::Row r;
        r.slice = s;
        r.dynamic = d;
        r.echo = 2;
        rows.push_back(r);
        fixture::AppendSlab(bytes, 16, static_cast<uint16_t>(s * 10 + d));
      }
    }
    auto const m = Model(rows);
    auto const a = Assemble(m, RecBuffer("test.rec", bytes));
    REQUIRE(a.images.size() == 1);
    CHECK(a.warnings.empty());
    auto const &img = a.images[0];
    CHECK(img.data.dimensions() == Sz6{4, 4, 3, 1, 2, 1});
    CHECK(img.labels[0] == std::vector<Index>{4, 6, 9});
    CHECK(img.labels[1] == std::vector<Index>{2});
    CHECK(img.labels[2] == std::vector<Index>{2, 5});
    CHECK(img.filled() == 6);
    CHECK(img.data(0, 0, 0, 0, 0, 0) == Approx(42.f));
    CHECK(img.data(3, 3, 2, 0, 1, 0) == Approx(95.f));
    CHECK(img.data(1, 2, 1, 0, 1, 0) == Approx(65.f));
    CHECK(img.source(0, 0, 0, 0) == 4);
  }

  SECTION("Truncated")
  {
    fixture::Row r0, r1;
    r1.slice = 2;
    auto const        m = Model({r0, r1});
    std::vector<char> bytes;
    fixture::AppendSlab(bytes, 16 + 15, 1);
    CHECK_THROWS_AS(Assemble(m, RecBuffer("test.rec", bytes)), TruncatedDataError);
  }

  SECTION("Inconsistent geometry")
  {
    fixture::Row r0, r1, r2;
    r1.slice = 2;
    r2.slice = 3;
    r2.x = 2;
    r2.y = 2;
    auto const        m = Model({r0, r1, r2});
    std::vector<char> bytes;
    fixture::AppendSlab(bytes, 16 + 16 + 4, 1);
    auto const a = Assemble(m, RecBuffer("test.rec", bytes));
    REQUIRE(a.images.size() == 1);
    CHECK(a.images[0].data.dimension(2) == 2);
    CHECK(Count(a.warnings, Warning::Kind::InconsistentGeometry) == 1);
  }

  SECTION("Ambiguous geometry drops the image type")
  {
    fixture::Row m0, m1, p0;
    m1.slice = 2;
    m1.x = 2;
    m1.y = 2;
    p0.type = 3;
    auto const        m = Model({m0, m1, p0});
    std::vector<char> bytes;
    fixture::AppendSlab(bytes, 16 + 4 + 16, 1);
    auto const a = Assemble(m, RecBuffer("test.rec", bytes));
    REQUIRE(a.images.size() == 1);
    CHECK(a.images[0].type == ImageType::Phase);
    CHECK(Count(a.warnings, Warning::Kind::DroppedImageType) == 1);
  }

  SECTION("Duplicates")
  {
    fixture::Row r;
    auto const        m = Model({r, r});
    std::vector<char> bytes;
    fixture::AppendSlab(bytes, 16, 1);
    fixture::AppendSlab(bytes, 16, 2);
    auto const a = Assemble(m, RecBuffer("test.rec", bytes));
    REQUIRE(a.images.size() == 1);
    CHECK(Count(a.warnings, Warning::Kind::DuplicateRecord) == 1);
    CHECK(a.images[0].data(0, 0, 0, 0, 0, 0) == Approx(1.f));
  }

  SECTION("Irregular grid")
  {
    fixture::Row r0, r1, r2;
    r1.slice = 2;
    r2.dynamic = 2;
    auto const        m = Model({r0, r1, r2});
    std::vector<char> bytes;
    fixture::AppendSlab(bytes, 48, 7);
    auto const a = Assemble(m, RecBuffer("test.rec", bytes));
    REQUIRE(a.images.size() == 1);
    auto const &img = a.images[0];
    CHECK(Count(a.warnings, Warning::Kind::IrregularGrid) == 1);
    CHECK(img.filled() == 3);
    CHECK(img.source(1, 0, 1, 0) == -1);
    CHECK(std::isnan(img.data(0, 0, 1, 0, 1, 0)));
    CHECK(img.data(0, 0, 1, 0, 0, 0) == Approx(7.f));
  }

  SECTION("Image types are independent")
  {
    std::vector<fixture::Row> rows;
    for (Index t : {0, 1, 2, 3}) {
      fixture::Row r;
      r.type = t;
      r.x = 2 + t;
      r.y = 2;
      rows.push_back(r);
    }
    auto const        m = Model(rows);
    std::vector<char> bytes;
    fixture::AppendSlab(bytes, 4 + 6 + 8 + 10, 3);
    auto const a = Assemble(m, RecBuffer("test.rec", bytes));
    REQUIRE(a.images.size() == 4);
    CHECK(a.warnings.empty());
    for (Index t = 0; t < 4; t++) {
      CHECK(a.images[t].type == ImageTypeFromCode(t));
      CHECK(a.images[t].data.dimension(1) == 2 + t);
    }
  }
}
