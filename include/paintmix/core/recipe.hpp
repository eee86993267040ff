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

#pragma once

#include <paintmix/core/catalog.hpp>
#include <paintmix/core/color.hpp>
#include <paintmix/core/mixing.hpp>
#include <array>
#include <limits>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace pmx {
  // Largest nr. of pigments explored by combinatorial search, regardless of constraints
  constexpr static uint search_tier_ceiling = 3;

  // Available strategies for finding ratios per pigment combination
  enum class SearchMethod {
    eGrid, // Fixed ratio grid; 5% steps for pairs, 10% steps for triples
    eLocal // Per-combination SLSQP over the ratio simplex, seeded from the uniform mix
  };

  // Search and reporting configuration; defaults reproduce the canonical recipe search
  struct SearchSettings {
    uint         candidates    = default_candidate_count;  // Size of candidate pool
    MixModel     model         = MixModel::eKubelkaMunk;   // Mixing model for search and report
    MixParams    params        = { };                      // Mixing model constants
    DeltaEMethod search_metric = DeltaEMethod::eDE76;      // Metric minimized during search
    DeltaEMethod report_metric = DeltaEMethod::eDE00;      // Metric of the final recipe
    SearchMethod method        = SearchMethod::eGrid;      // Ratio search strategy
    float        batch_mass    = 10.f;                     // Total pigment mass in grams
    float        min_share     = 0.05f;                    // Shares below are dropped from recipes

  public:
    // Throws a ValidationException on out-of-range values
    void validate() const;
  };

  // Raw optimum of combinatorial search over a candidate pool
  struct MixSolution {
    std::vector<uint>  indices;  // Ascending indices into the candidate pool
    std::vector<float> ratios;   // Unfiltered ratios, summing to 1
    float              distance = std::numeric_limits<float>::infinity(); // Search metric to target
  };

  // Single line of a production recipe
  struct RecipeLine {
    Pigment pigment;    // Catalog entry
    uint    percentage; // Integer share in [5, 100]
    float   grams;      // Mass within the batch
  };

  // Formatted recipe; percentages sum to exactly 100
  struct RecipeResult {
    Lab                     target;       // Requested color
    std::vector<RecipeLine> lines;        // Ordered by descending percentage
    Lab                     mixed;        // Predicted color of the recipe as formatted
    float                   delta_e;      // Distance between target and mixed under metric
    DeltaEMethod            metric;       // Report metric
    float                   thinner_mass; // Solvent added on top of the pigment batch
    bool                    tier_limited; // Search explored fewer pigments than allowed
  };

  // Coarse grading of a reported color difference
  enum class MatchQuality {
    eVeryClose, // Below 3
    eClose,     // Below 6
    eUsable,    // Below 10
    eNoticeable
  };

  // Argument struct for searching the best mix of a candidate pool
  struct MixSolveInfo {
    const Lab               &target;      // Color to approximate
    std::span<const Pigment> pool;        // Candidate pool, already filtered and pruned
    const MixConstraints    &constraints; // Recipe size and dilution
    const SearchSettings    &settings;    // Search configuration
  };

  // Argument struct for producing a formatted recipe from a full catalog
  struct RecipeSolveInfo {
    const Lab               &target;      // Color to approximate
    std::span<const Pigment> catalog;     // Full, unfiltered catalog
    const MixConstraints    &constraints; // Exclusions, recipe size and dilution
    const SearchSettings    &settings;    // Search configuration
  };

  namespace detail {
    // Search space of a single tier of k pigments. Combinations of [0, n) are produced in
    // lexicographic order and ratio grid points in ascending order of their leading shares;
    // the search resolves ties by this order
    std::vector<std::array<uint,  search_tier_ceiling>> enumerate_combinations(uint n, uint k);
    std::vector<std::array<float, search_tier_ceiling>> enumerate_ratio_grid(uint k);
  } // namespace detail

  // Search tiers of 1..min(max_pigments, search_tier_ceiling) pigments; returns the global
  // minimum, ties resolved by the first combination found in enumeration order
  MixSolution solve_mix(const MixSolveInfo &info);

  // Filter the catalog, select candidates, search and format; throws an
  // EmptyCatalogException if no pigment survives the exclusion filters
  RecipeResult solve_recipe(const RecipeSolveInfo &info);

  // Shorthand for solve_recipe
  RecipeResult optimize_recipe(const Lab               &target,
                               std::span<const Pigment> catalog,
                               const MixConstraints    &constraints = { },
                               const SearchSettings    &settings    = { });

  // Turn a raw solution into a production recipe; drops shares below settings.min_share,
  // rounds to integer percentages and recomputes the mixed color from the recipe itself
  RecipeResult format_recipe(const Lab               &target,
                             std::span<const Pigment> pool,
                             const MixSolution       &solution,
                             const MixConstraints    &constraints,
                             const SearchSettings    &settings);

  // Recipe grading and plain-text rendering
  MatchQuality     match_quality(float delta_e);
  std::string_view to_string(MatchQuality quality);
  std::string      format_recipe_text(const RecipeResult &result);

  // Human-readable method names
  std::string_view to_string(SearchMethod method);
  SearchMethod     search_method_from_string(std::string_view s);
} // namespace pmx
