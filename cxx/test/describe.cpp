#include "mm/crop.hpp"
#include "mm/describe.hpp"

#include <limits>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace mm;
using namespace Catch;

TEST_CASE("Describe", "[describe]")
{
  CHECK(FormatDate("2023.05.07 / 10:11:12") == "May 07, 2023");
  CHECK(FormatDate("2019.12.31 / 23:59:59") == "December 31, 2019");
  CHECK_THROWS_AS(FormatDate("yesterday"), Log::Failure);
  CHECK_THROWS_AS(FormatDate("2019.13.01 / 00:00:00"), Log::Failure);

  ScanParameters s;
  s.seriesType = "Image   MRSERIES";
  s.examinationDateTime = "2023.05.17 / 10:11:12";
  s.technique = "FFE";
  s.scanMode = "3D";
  s.scanResolution = {128, 96};
  s.maxSlices = 20;
  s.maxDynamics = 1;
  s.phaseEncodingVelocity << 0.f, 0.f, 100.f;
  auto const d = Describe(s);
  CHECK(d.find("- Type: Image   MRSERIES\n") != std::string::npos);
  CHECK(d.find("- Date: May 17, 2023\n") != std::string::npos);
  CHECK(d.find("- Dimension: 3D\n") != std::string::npos);
  CHECK(d.find("- Resolution: 128x96 pixels\n") != std::string::npos);
  CHECK(d.find("- Slices: 20\n") != std::string::npos);
  CHECK(d.find("- Dynamics: None\n") != std::string::npos);
  CHECK(d.find("- Flow Encoding: Yes\n") != std::string::npos);
  CHECK(d.find("- Diffusion Encoding: No\n") != std::string::npos);

  s.scanMode = "MS";
  s.maxDynamics = 30;
  s.phaseEncodingVelocity.setZero();
  auto const d2 = Describe(s);
  CHECK(d2.find("- Dimension: 2D\n") != std::string::npos);
  CHECK(d2.find("- Dynamics: 30\n") != std::string::npos);
  CHECK(d2.find("- Flow Encoding: No\n") != std::string::npos);
}

TEST_CASE("Crop", "[crop]")
{
  ImageArray img;
  img.data.resize(Sz6{6, 5, 4, 1, 2, 1});
  img.data.setZero();
  img.source.resize(Sz4{4, 1, 2, 1});
  img.source.setValues({{{{0}, {4}}}, {{{1}, {5}}}, {{{2}, {6}}}, {{{3}, {7}}}});
  img.labels = {std::vector<Index>{1, 2, 3, 4}, {1}, {1, 2}, {1}};

  SECTION("Bounding box")
  {
    img.data(1, 2, 1, 0, 0, 0) = 3.f;
    img.data(3, 3, 2, 0, 1, 0) = -1.f;
    img.data(5, 0, 3, 0, 0, 0) = std::numeric_limits<float>::quiet_NaN();
    auto const c = CropToSupport(img);
    CHECK(c.data.dimensions() == Sz6{3, 2, 2, 1, 2, 1});
    CHECK(c.data(0, 0, 0, 0, 0, 0) == Approx(3.f));
    CHECK(c.data(2, 1, 1, 0, 1, 0) == Approx(-1.f));
    CHECK(c.labels[0] == std::vector<Index>{2, 3});
    CHECK(c.labels[2] == img.labels[2]);
    CHECK(c.source.dimension(0) == 2);
    CHECK(c.source(0, 0, 1, 0) == 5);
  }

  SECTION("Empty")
  {
    auto const c = CropToSupport(img);
    CHECK(c.data.dimensions() == img.data.dimensions());
  }
}
