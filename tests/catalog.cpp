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
#include <paintmix/core/catalog.hpp>
#include <paintmix/core/ranges.hpp>
#include <algorithm>
#include <string>
#include <vector>

using namespace pmx;

namespace {
  std::vector<Pigment> sample_catalog() {
    return {
      { "C1",   "White",      "Mr. Color",  "basic",     Lab(94.1f, -0.6f,  2.1f)  },
      { "C2",   "Black",      "Mr. Color",  "basic",     Lab(16.2f,  0.3f, -0.4f)  },
      { "C3",   "Red",        "Mr. Color",  "basic",     Lab(45.3f, 62.8f, 40.1f)  },
      { "C8",   "Silver",     "Mr. Color",  "metallic",  Lab(72.5f, -0.4f,  0.9f)  },
      { "C9",   "Gold",       "Mr. Color",  "metallic",  Lab(64.3f,  5.1f, 38.2f)  },
      { "C62",  "Flat White", "Mr. Color",  "basic",     Lab(92.5f,  0.1f,  0.2f)  },
      { "LP-7", "Pure Red",   "Tamiya",     "basic",     Lab(47.2f, 64.5f, 43.8f)  },
      { "EX-01","Ex-White",   "Gaia Color", "basic",     Lab(95.0f, -0.3f,  1.2f)  }
    };
  }

  std::vector<std::string> codes_of(std::span<const Pigment> pigments) {
    return pigments
         | vws::transform([](const Pigment &p) { return p.code; })
         | view_to<std::vector<std::string>>();
  }
} // namespace

TEST_CASE("Constraint validation") {
  MixConstraints c;
  CHECK_NOTHROW(c.validate());

  SECTION("Pigment count") {
    c.max_pigments = 0;
    CHECK_THROWS_AS(c.validate(), ValidationException);
    c.max_pigments = 6;
    CHECK_THROWS_AS(c.validate(), ValidationException);
    c.max_pigments = 5;
    CHECK_NOTHROW(c.validate());
  } // SECTION

  SECTION("Dilution") {
    c.dilution = -0.1f;
    CHECK_THROWS_AS(c.validate(), ValidationException);
    c.dilution = 1.f;
    CHECK_THROWS_AS(c.validate(), ValidationException);
    c.dilution = 0.5f;
    CHECK_NOTHROW(c.validate());
  } // SECTION
}

TEST_CASE("Catalog filtering") {
  auto catalog = sample_catalog();

  SECTION("No exclusions") {
    CHECK(filter_catalog(catalog, { }) == catalog);
  } // SECTION

  SECTION("Excluded categories") {
    auto filtered = filter_catalog(catalog, { .excluded_categories = { "metallic" } });
    CHECK(codes_of(filtered) == std::vector<std::string> { "C1", "C2", "C3", "C62", "LP-7", "EX-01" });
  } // SECTION

  SECTION("Excluded codes and manufacturers") {
    auto filtered = filter_catalog(catalog, { .excluded_codes         = { "C3", "C9" },
                                              .excluded_manufacturers = { "Tamiya" } });
    CHECK(codes_of(filtered) == std::vector<std::string> { "C1", "C2", "C8", "C62", "EX-01" });
  } // SECTION

  SECTION("White, black and silver") {
    auto filtered = filter_catalog(catalog, { .exclude_white_black = true });
    CHECK(codes_of(filtered) == std::vector<std::string> { "C1", "C3", "C9", "LP-7" });

    auto codes = white_black_silver_codes();
    CHECK(rng::find(codes, "C62") != codes.end());
    CHECK(rng::find(codes, "LP-18") != codes.end());
  } // SECTION

  SECTION("Everything excluded") {
    auto filtered = filter_catalog(catalog, { .excluded_categories = { "basic", "metallic" } });
    CHECK(filtered.empty());
  } // SECTION
}

TEST_CASE("Candidate selection") {
  auto catalog = sample_catalog();

  SECTION("Nearest first") {
    auto candidates = select_candidates(catalog, Lab(46.f, 63.f, 41.f), 3);
    REQUIRE(candidates.size() == 3);
    CHECK(candidates[0].code == "C3");
    CHECK(candidates[1].code == "LP-7");

    Lab target = Lab(46.f, 63.f, 41.f);
    CHECK(rng::is_sorted(candidates, {}, [&](const Pigment &p) { return delta_e_76(p.lab, target); }));
  } // SECTION

  SECTION("Pool smaller than count") {
    auto candidates = select_candidates(catalog, Lab(50.f, 0.f, 0.f), 15);
    CHECK(candidates.size() == catalog.size());
  } // SECTION

  SECTION("Ties keep catalog order") {
    std::vector<Pigment> twins = {
      { "B", "Gray", "", "basic", Lab(60.f, 0.f, 0.f) },
      { "A", "Gray", "", "basic", Lab(60.f, 0.f, 0.f) },
      { "C", "Gray", "", "basic", Lab(40.f, 0.f, 0.f) }
    };
    auto candidates = select_candidates(twins, Lab(50.f, 0.f, 0.f), 3);
    CHECK(codes_of(candidates) == std::vector<std::string> { "B", "A", "C" });
  } // SECTION
}
