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
#include <catch2/matchers/catch_matchers_string.hpp>
#include <paintmix/core/mixing.hpp>
#include <cmath>
#include <limits>
#include <string>
#include <vector>

using namespace pmx;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::ContainsSubstring;

constexpr static float eps = 1e-4f;

namespace {
  const Lab white = Lab(92.5f, 0.f, 0.f);
  const Lab black = Lab(15.3f, 0.f, 0.f);
  const Lab red   = Lab(45.3f, 62.8f, 40.1f);
  const Lab blue  = Lab(33.9f, 12.6f, -52.4f);

  bool approx_equal(const Lab &a, const Lab &b, float tol = eps) {
    return ((a - b).abs() <= tol).all();
  }
} // namespace

TEST_CASE("Kubelka-Munk mixing") {
  SECTION("Identity") {
    for (const Lab &c : { white, black, red, blue, Lab(0.f, 0.f, 0.f), Lab(100.f, -5.f, 3.f) }) {
      std::vector<Lab> colors = { c };
      CHECK(approx_equal(mix_kubelka_munk(colors, std::vector<float> { 1.f }), c));
      CHECK(approx_equal(mix_kubelka_munk(colors, std::vector<float> { 0.3f }), c));
    }

    // Zero-share components do not take part in the mix
    std::vector<Lab> colors = { red, blue };
    CHECK(approx_equal(mix_kubelka_munk(colors, std::vector<float> { 1.f, 0.f }), red));
  } // SECTION

  SECTION("Darkness dominance") {
    std::vector<Lab> colors = { Lab(92.5f, 0.f, 0.f), Lab(15.3f, 0.f, 0.f) };
    Lab c = mix_kubelka_munk(colors, std::vector<float> { 0.5f, 0.5f });

    float linear = 0.5f * (92.5f + 15.3f);
    CHECK(c[0] < linear);
    CHECK(c[0] > 15.3f);
    REQUIRE_THAT(c[0], WithinAbs(20.6f, 0.5f));
  } // SECTION

  SECTION("Monotonic gamma") {
    std::vector<Lab>   colors = { white, black };
    std::vector<float> ratios = { 0.5f, 0.5f };

    float prev = std::numeric_limits<float>::infinity();
    for (float gamma : { 1.0f, 1.6f, 2.2f, 2.6f, 3.0f }) {
      float l = mix_kubelka_munk(colors, ratios, { .gamma = gamma })[0];
      CHECK(l < prev);
      prev = l;
    }
  } // SECTION

  SECTION("Chroma decay") {
    std::vector<Lab> colors = { red, blue };
    Lab c = mix_kubelka_munk(colors, std::vector<float> { 0.5f, 0.5f });

    Lab linear = 0.5f * (red + blue);
    CHECK(std::abs(c[1]) < std::abs(linear[1]));
    CHECK(std::abs(c[2]) < std::abs(linear[2]));
    CHECK(std::signbit(c[1]) == std::signbit(linear[1]));
    CHECK(std::signbit(c[2]) == std::signbit(linear[2]));
  } // SECTION

  SECTION("Ratio normalization and order") {
    std::vector<Lab> colors   = { red, white };
    std::vector<Lab> reversed = { white, red };

    Lab a = mix_kubelka_munk(colors,   std::vector<float> { 0.25f, 0.75f });
    Lab b = mix_kubelka_munk(colors,   std::vector<float> { 1.f, 3.f });
    Lab c = mix_kubelka_munk(reversed, std::vector<float> { 0.75f, 0.25f });
    CHECK(approx_equal(a, b, 1e-3f));
    CHECK(approx_equal(a, c, 1e-3f));
  } // SECTION
}

TEST_CASE("Hybrid mixing") {
  SECTION("Identity") {
    for (const Lab &c : { white, black, red, blue }) {
      std::vector<Lab> colors = { c };
      CHECK(approx_equal(mix_hybrid(colors, std::vector<float> { 1.f }), c));
    }
  } // SECTION

  SECTION("Lightness between linear and Kubelka-Munk") {
    std::vector<Lab>   colors = { white, black };
    std::vector<float> ratios = { 0.5f, 0.5f };

    float l_km     = mix_kubelka_munk(colors, ratios)[0];
    float l_linear = 0.5f * (white[0] + black[0]);
    float l_hybrid = mix_hybrid(colors, ratios)[0];
    CHECK(l_hybrid > l_km);
    CHECK(l_hybrid < l_linear);

    // Weight towards Kubelka-Munk follows the darkest component
    float w = 0.3f + 0.5f * (100.f - black[0]) / 100.f;
    REQUIRE_THAT(l_hybrid, WithinAbs(l_linear * (1.f - w) + l_km * w, 1e-3f));
  } // SECTION

  SECTION("Chroma attenuation per component") {
    Lab c = Lab(50.f, 20.f, 0.f);

    std::vector<Lab> two   = { c, c };
    std::vector<Lab> three = { c, c, c };
    REQUIRE_THAT(mix_hybrid(two,   std::vector<float> { 1.f, 1.f })[1],      WithinAbs(19.f, 1e-3f));
    REQUIRE_THAT(mix_hybrid(three, std::vector<float> { 1.f, 1.f, 1.f })[1], WithinAbs(18.f, 1e-3f));

    // Components at or below a 1% share do not count towards attenuation
    REQUIRE_THAT(mix_hybrid(two, std::vector<float> { 0.995f, 0.005f })[1], WithinAbs(20.f, 1e-3f));
  } // SECTION
}

TEST_CASE("Mixing dispatch and validation") {
  std::vector<Lab> colors = { red, blue };

  SECTION("Dispatch") {
    std::vector<float> ratios = { 0.4f, 0.6f };
    CHECK(approx_equal(mix(colors, ratios, MixModel::eKubelkaMunk), mix_kubelka_munk(colors, ratios)));
    CHECK(approx_equal(mix(colors, ratios, MixModel::eHybrid),      mix_hybrid(colors, ratios)));
    CHECK(mix_model_from_string("hybrid") == MixModel::eHybrid);
    CHECK(mix_model_from_string(to_string(MixModel::eKubelkaMunk)) == MixModel::eKubelkaMunk);
    CHECK_THROWS_AS(mix_model_from_string("linear"), ValidationException);
  } // SECTION

  SECTION("Neutral fallback") {
    CHECK(approx_equal(mix(colors, std::vector<float> { 0.f, 0.f }), neutral_mix_color));
    CHECK(approx_equal(mix(std::vector<Lab> { }, std::vector<float> { }), neutral_mix_color));
    CHECK(approx_equal(mix(colors, std::vector<float> { 0.f, 0.f }, MixModel::eHybrid), neutral_mix_color));
  } // SECTION

  SECTION("Invalid ratios") {
    CHECK_THROWS_AS(mix(colors, std::vector<float> { 1.f }),               ValidationException);
    CHECK_THROWS_AS(mix(colors, std::vector<float> { 1.f, -0.5f }),        ValidationException);
    CHECK_THROWS_AS(mix(colors, std::vector<float> { 1.f, std::nanf("") }), ValidationException);
    CHECK_THROWS_AS(mix(colors, std::vector<float> { 0.5f, 0.5f }, MixModel::eKubelkaMunk, { .gamma = 0.f }),
                    ValidationException);
  } // SECTION
}

TEST_CASE("Runtime checks") {
  SECTION("Messages are only produced on failure") {
    uint calls = 0;
    auto msg = [&calls] { ++calls; return std::string("unreachable"); };
    CHECK_NOTHROW(runtime_check(true, msg));
    CHECK(calls == 0);
    CHECK_THROWS_AS(runtime_check(false, msg), ValidationException);
    CHECK(calls == 1);
    CHECK_THROWS_AS(runtime_check<EmptyCatalogException>(false, msg), EmptyCatalogException);
  } // SECTION

  SECTION("Failed mix reports the offending ratio") {
    std::vector<Lab> colors = { red, blue };
    CHECK_THROWS_WITH(mix(colors, std::vector<float> { 1.f, -0.5f }),
                      ContainsSubstring("got -0.5"));
  } // SECTION
}
