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

#include <paintmix/core/recipe.hpp>
#include <paintmix/core/ranges.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>
#include <iterator>
#include <numeric>

namespace pmx {
  namespace detail {
    // Percentage below which a line is never printed; recipe lines below this are
    // folded back into the remaining lines
    constexpr uint min_line_percentage = 5;

    // Match grading thresholds
    constexpr float quality_very_close = 3.f;
    constexpr float quality_close      = 6.f;
    constexpr float quality_usable     = 10.f;

    // Pool index and share of a single recipe component, prior to rounding
    struct RecipeShare {
      uint  index;
      float ratio;
      uint  percentage = 0;
    };

    // Renormalize shares to sum to 1 and round to integer percentages
    void round_shares(std::vector<RecipeShare> &shares) {
      float total = std::accumulate(range_iter(shares), 0.f,
        [](float f, const RecipeShare &s) { return f + s.ratio; });
      for (auto &s : shares) {
        s.ratio      /= total;
        s.percentage  = static_cast<uint>(std::lround(s.ratio * 100.f));
      }
    }
  } // namespace detail

  RecipeResult format_recipe(const Lab               &target,
                             std::span<const Pigment> pool,
                             const MixSolution       &solution,
                             const MixConstraints    &constraints,
                             const SearchSettings    &settings) {
    pmx_trace();

    runtime_check(solution.indices.size() == solution.ratios.size() && !solution.indices.empty(),
      "recipe formatting requires a non-empty solution");
    for (uint i : solution.indices)
      runtime_check(i < pool.size(),
        fmt::format("solution index {} exceeds candidate pool of {}", i, pool.size()));

    // Drop negligible shares from the raw solution
    std::vector<detail::RecipeShare> shares;
    for (auto [i, r] : view_zip(solution.indices, solution.ratios))
      if (r >= settings.min_share)
        shares.push_back({ i, r });

    // If nothing remains, the dominant pigment is used on its own; first maximum wins
    if (shares.empty()) {
      auto it = rng::max_element(solution.ratios);
      shares.push_back({ solution.indices[std::distance(solution.ratios.begin(), it)], 1.f });
    }

    // Round to percentages; lines that round below the printable minimum are dropped
    // smallest first and the remainder renormalized, which only ever raises the other
    // percentages
    detail::round_shares(shares);
    while (shares.size() > 1) {
      auto it = rng::min_element(shares, {}, &detail::RecipeShare::ratio);
      guard_break(it->percentage < detail::min_line_percentage);
      shares.erase(it);
      detail::round_shares(shares);
    }

    // Rounding remainder goes to the largest line, so that percentages sum to exactly 100
    int remainder = 100 - std::accumulate(range_iter(shares), 0,
      [](int i, const auto &s) { return i + static_cast<int>(s.percentage); });
    auto &largest = *rng::max_element(shares, {}, &detail::RecipeShare::percentage);
    largest.percentage = static_cast<uint>(static_cast<int>(largest.percentage) + remainder);

    // Order by descending percentage, ties in candidate order
    rng::stable_sort(shares, rng::greater {}, &detail::RecipeShare::percentage);

    RecipeResult result = {
      .target       = target,
      .metric       = settings.report_metric,
      .thinner_mass = settings.batch_mass * constraints.dilution / (1.f - constraints.dilution),
      .tier_limited = constraints.max_pigments > search_tier_ceiling
    };

    // Assemble lines, and recompute the mixed color from the recipe as it will be produced
    std::vector<Lab>   colors;
    std::vector<float> ratios;
    for (const auto &s : shares) {
      const Pigment &p = pool[s.index];
      float share = static_cast<float>(s.percentage) / 100.f;
      result.lines.push_back({ .pigment    = p,
                               .percentage = s.percentage,
                               .grams      = share * settings.batch_mass });
      colors.push_back(p.lab);
      ratios.push_back(share * (1.f - constraints.dilution));
    }

    result.mixed   = mix(colors, ratios, settings.model, settings.params);
    result.delta_e = color_difference(result.mixed, target, settings.report_metric);

    return result;
  }

  MatchQuality match_quality(float delta_e) {
    if (delta_e < detail::quality_very_close) return MatchQuality::eVeryClose;
    if (delta_e < detail::quality_close)      return MatchQuality::eClose;
    if (delta_e < detail::quality_usable)     return MatchQuality::eUsable;
    return MatchQuality::eNoticeable;
  }

  std::string_view to_string(MatchQuality quality) {
    switch (quality) {
      case MatchQuality::eVeryClose: return "very close";
      case MatchQuality::eClose:     return "close";
      case MatchQuality::eUsable:    return "noticeable, but usable";
      default:                       return "clearly different; a larger catalog may help";
    }
  }

  std::string format_recipe_text(const RecipeResult &result) {
    pmx_trace();

    std::string s;
    auto out = std::back_inserter(s);

    fmt::format_to(out, "Mixing recipe\n\n");
    for (const auto &line : result.lines) {
      fmt::format_to(out, "  {} {} ({})\n", line.pigment.code, line.pigment.name, line.pigment.manufacturer);
      fmt::format_to(out, "    -> {:>3}% ({:.2f}g)\n", line.percentage, line.grams);
    }

    float total = std::accumulate(range_iter(result.lines), 0.f,
      [](float f, const RecipeLine &l) { return f + l.grams; });
    fmt::format_to(out, "\nTotal: {:.1f}g\n", total);
    if (result.thinner_mass > 0.f)
      fmt::format_to(out, "Thinner: {:.2f}g\n", result.thinner_mass);

    fmt::format_to(out, "\nTarget: {} ({})\n", result.target, to_hex(lab_to_rgb(result.target)));
    fmt::format_to(out, "Mixed:  {} ({})\n",   result.mixed,  to_hex(lab_to_rgb(result.mixed)));
    fmt::format_to(out, "{} = {:.1f}\n-> {}\n",
      to_string(result.metric), result.delta_e, to_string(match_quality(result.delta_e)));

    if (result.tier_limited)
      fmt::format_to(out, "\nNote: search explores at most {} pigments per recipe\n", search_tier_ceiling);

    return s;
  }
} // namespace pmx
