// Copyright (C) 2024 Mark van de Ruit, Delft University of Technology.
// 
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
// 
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
// 
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <https://www.gnu.org/licenses/>.

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <paintmix/core/io.hpp>
#include <paintmix/core/json.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <limits>
#include <string>
#include <vector>

using namespace pmx;
using Catch::Matchers::WithinAbs;

namespace {
  // Scoped file in the temporary directory, removed on destruction
  struct TempFile {
    fs::path path;

    TempFile(std::string_view name, const std::string &contents)
    : path(fs::temp_directory_path() / name) {
      io::save_string(path, contents);
    }

    ~TempFile() {
      std::error_code ec;
      fs::remove(path, ec);
    }
  };

  constexpr std::string_view csv_catalog =
    "# Sample data\n"
    "code,name,manufacturer,category,L,a,b\n"
    "C62,Flat White,Mr. Color,basic,92.5,0.1,0.2\r\n"
    "\n"
    "C8, Silver ,Mr. Color,metallic,72.5,-0.4,0.9\n";
} // namespace

TEST_CASE("CSV catalog parsing") {
  SECTION("Plain header") {
    auto catalog = io::catalog_from_csv(csv_catalog);
    REQUIRE(catalog.size() == 2);
    CHECK(catalog[0].code         == "C62");
    CHECK(catalog[0].manufacturer == "Mr. Color");
    CHECK(catalog[1].name         == "Silver");
    CHECK(catalog[1].category     == "metallic");
    REQUIRE_THAT(catalog[1].lab[1], WithinAbs(-0.4f, 1e-6f));
  } // SECTION

  SECTION("Reordered and extra columns") {
    auto catalog = io::catalog_from_csv(
      "L,a,b,code,notes,name,category,manufacturer\n"
      "15.3,0.2,0.1,C33,matte,Flat Black,basic,Mr. Color\n");
    REQUIRE(catalog.size() == 1);
    CHECK(catalog[0].code == "C33");
    CHECK(catalog[0].name == "Flat Black");
    REQUIRE_THAT(catalog[0].lab[0], WithinAbs(15.3f, 1e-6f));
  } // SECTION

  SECTION("Malformed data") {
    CHECK_THROWS_AS(io::catalog_from_csv("code,name,L,a,b\nC1,White,90,0,0\n"), ValidationException);
    CHECK_THROWS_AS(io::catalog_from_csv("code,name,manufacturer,category,L,a,b\nC1,White,X,basic,ninety,0,0\n"),
                    ValidationException);
    CHECK_THROWS_AS(io::catalog_from_csv("code,name,manufacturer,category,L,a,b\nC1,White,X\n"), ValidationException);
    CHECK_THROWS_AS(io::catalog_from_csv("# comments only\n"), ValidationException);
  } // SECTION

  SECTION("Non-finite values") {
    CHECK_THROWS_AS(io::catalog_from_csv("code,name,manufacturer,category,L,a,b\nC1,White,X,basic,nan,0,0\n"),
                    ValidationException);
    CHECK_THROWS_AS(io::catalog_from_csv("code,name,manufacturer,category,L,a,b\nC1,White,X,basic,90,inf,0\n"),
                    ValidationException);
  } // SECTION
}

TEST_CASE("Target parsing") {
  SECTION("Hex") {
    Lab a = io::parse_target("#808080");
    Lab b = rgb_to_lab(128, 128, 128);
    CHECK((a == b).all());
  } // SECTION

  SECTION("Lab triple") {
    Lab c = io::parse_target(" 50, 10.5, -5 ");
    CHECK((c == Lab(50.f, 10.5f, -5.f)).all());
  } // SECTION

  SECTION("Malformed") {
    CHECK_THROWS_AS(io::parse_target("50,10"),     ValidationException);
    CHECK_THROWS_AS(io::parse_target("120,0,0"),   ValidationException);
    CHECK_THROWS_AS(io::parse_target("50,x,0"),    ValidationException);
    CHECK_THROWS_AS(io::parse_target("#80808"),    ValidationException);
    CHECK_THROWS_AS(io::parse_target("nan,0,0"),   ValidationException);
    CHECK_THROWS_AS(io::parse_target("50,-inf,0"), ValidationException);
  } // SECTION
}

TEST_CASE("File loading") {
  SECTION("CSV catalog") {
    TempFile file("paintmix_test_catalog.csv", std::string(csv_catalog));
    auto catalog = io::load_catalog(file.path);
    CHECK(catalog.size() == 2);
  } // SECTION

  SECTION("JSON catalog") {
    TempFile file("paintmix_test_catalog.json", R"({
      "pigments": [
        { "code": "C62", "name": "Flat White", "manufacturer": "Mr. Color", "category": "basic",
          "L": 92.5, "a": 0.1, "b": 0.2 },
        { "code": "LP-1", "L": 15.6, "a": 0.2, "b": -0.1 }
      ]
    })");
    auto catalog = io::load_catalog(file.path);
    REQUIRE(catalog.size() == 2);
    CHECK(catalog[0].name == "Flat White");
    CHECK(catalog[1].code == "LP-1");
    CHECK(catalog[1].manufacturer.empty());
  } // SECTION

  SECTION("Presets") {
    TempFile file("paintmix_test_presets.json", R"({
      "presets": [
        { "name": "Olive drab", "category": "armor", "L": 37.4, "a": -0.9, "b": 17.5 },
        { "name": "Neutral gray", "L": 53.6, "a": 0.0, "b": 0.0 }
      ]
    })");
    auto presets = io::load_presets(file.path);
    REQUIRE(presets.size() == 2);
    REQUIRE_THAT(io::find_preset(presets, "Neutral gray").lab[0], WithinAbs(53.6f, 1e-6f));
    CHECK_THROWS_AS(io::find_preset(presets, "Dunkelgelb"), ValidationException);
  } // SECTION

  SECTION("Non-finite JSON entries") {
    constexpr float inf = std::numeric_limits<float>::infinity();
    json pigment = { { "code", "C1" }, { "L", 90.f }, { "a", inf }, { "b", 0.f } };
    CHECK_THROWS_AS(pigment.get<Pigment>(), ValidationException);

    json preset = { { "name", "Broken" }, { "L", inf }, { "a", 0.f }, { "b", 0.f } };
    CHECK_THROWS_AS(preset.get<io::Preset>(), ValidationException);
  } // SECTION

  SECTION("Missing and malformed files") {
    CHECK_THROWS_AS(io::load_catalog(fs::temp_directory_path() / "paintmix_missing.csv"), ValidationException);

    TempFile file("paintmix_test_broken.json", "{ \"pigments\": [ ");
    CHECK_THROWS_AS(io::load_catalog(file.path), ValidationException);
  } // SECTION
}

TEST_CASE("Configuration") {
  SECTION("Constraints") {
    auto c = json::parse(R"({ "max_pigments": 2, "excluded_categories": [ "metallic" ], "dilution": 0.1 })")
           .get<MixConstraints>();
    CHECK(c.max_pigments == 2);
    CHECK(c.excluded_categories.contains("metallic"));
    CHECK(c.excluded_codes.empty());
    CHECK(!c.exclude_white_black);
    REQUIRE_THAT(c.dilution, WithinAbs(0.1f, 1e-6f));

    CHECK_THROWS_AS(json::parse(R"({ "max_pigments": 9 })").get<MixConstraints>(), ValidationException);
  } // SECTION

  SECTION("Settings") {
    auto s = json::parse(R"({ "model": "hybrid", "method": "local", "report_metric": "DE76",
                              "params": { "gamma": 2.6 } })").get<SearchSettings>();
    CHECK(s.model         == MixModel::eHybrid);
    CHECK(s.method        == SearchMethod::eLocal);
    CHECK(s.report_metric == DeltaEMethod::eDE76);
    CHECK(s.search_metric == DeltaEMethod::eDE76);
    CHECK(s.candidates    == default_candidate_count);
    REQUIRE_THAT(s.params.gamma,   WithinAbs(2.6f, 1e-6f));
    REQUIRE_THAT(s.params.epsilon, WithinAbs(1e-6f, 1e-9f));

    CHECK_THROWS_AS(json::parse(R"({ "model": "spectral" })").get<SearchSettings>(), ValidationException);
    CHECK_THROWS_AS(json::parse(R"({ "batch_mass": -1 })").get<SearchSettings>(),    ValidationException);
  } // SECTION

  SECTION("Defaults survive serialization") {
    SearchSettings s = json(SearchSettings { }).get<SearchSettings>();
    CHECK(s.model         == SearchSettings { }.model);
    CHECK(s.report_metric == DeltaEMethod::eDE00);
    CHECK(s.batch_mass    == 10.f);
  } // SECTION

  SECTION("Recipe export") {
    RecipeResult r = {
      .target       = Lab(50.f, 0.f, 0.f),
      .lines        = { { .pigment    = { "C62", "Flat White", "Mr. Color", "basic", Lab(92.5f, 0.1f, 0.2f) },
                          .percentage = 100,
                          .grams      = 10.f } },
      .mixed        = Lab(92.5f, 0.1f, 0.2f),
      .delta_e      = 30.f,
      .metric       = DeltaEMethod::eDE00,
      .thinner_mass = 0.f,
      .tier_limited = false
    };
    json js = r;
    CHECK(js.at("lines").size() == 1);
    CHECK(js.at("lines")[0].at("code") == "C62");
    CHECK(js.at("metric") == "DE00");
    CHECK(js.at("target").size() == 3);
    CHECK(js.at("target_hex").get<std::string>().size() == 7);
  } // SECTION
}
